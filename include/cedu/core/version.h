#pragma once

namespace cedu::core {

// kBuildVersion is the current software version string.
constexpr const char* kBuildVersion = "0.2.0";

// Format version written into submission and pack documents.
constexpr const char* kDocumentVersion = "1.0";

}  // namespace cedu::core
