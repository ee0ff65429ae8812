#pragma once

#include <string>

#include "delivery/delivery_types.hpp"

namespace avatarlink {
namespace delivery {

// Stable SHA-256 fingerprint (lowercase hex) over every payload field.
// Fields are length-prefixed so ("ab","c") and ("a","bc") never collide.
std::string compute_fingerprint(const SpeakPayload &payload);

}  // namespace delivery
}  // namespace avatarlink
