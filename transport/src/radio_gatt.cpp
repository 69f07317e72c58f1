#include "radio_gatt.h"

namespace whisper::transport {

std::string_view CharacteristicUuid(Characteristic characteristic) {
  switch (characteristic) {
    case Characteristic::kContentOut:
      return "DD7A0B07-C618-4FC0-823E-3D01899EB697";
    case Characteristic::kContentIn:
      return "C14FC58F-5E4C-4D83-A9B2-781C0413B9C6";
    case Characteristic::kControlOut:
      return "270E4080-09CD-4E69-A23A-564661045D56";
    case Characteristic::kControlIn:
      return "FAADF8DD-DA86-4659-ACF7-8253A6F3B7A3";
  }
  return {};
}

const char* CharacteristicName(Characteristic characteristic) {
  switch (characteristic) {
    case Characteristic::kContentOut:
      return "content_out";
    case Characteristic::kContentIn:
      return "content_in";
    case Characteristic::kControlOut:
      return "control_out";
    case Characteristic::kControlIn:
      return "control_in";
  }
  return "unknown";
}

}  // namespace whisper::transport
