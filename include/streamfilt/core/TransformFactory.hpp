#pragma once

#include <memory>

#include <nlohmann/json.hpp>

#include "streamfilt/core/IirFilter.hpp"
#include "streamfilt/core/Transform.hpp"

namespace streamfilt {

// Reads "form" plus "b"/"a" or "sos" from an IIR params node.
FilterCoefficients_t parseCoefficients(const nlohmann::json& params);

// Creates a transform from {"type": "iir" | "kalman", "params": {...}}.
// Throws ConfigurationError on unknown types or malformed parameters.
std::shared_ptr<IStreamTransform> createTransform(const nlohmann::json& transformNode);

} // namespace streamfilt
