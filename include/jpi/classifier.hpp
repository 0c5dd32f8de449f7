#pragma once

#include "jpi/types.hpp"

#include <string>

namespace jpi {

// Packaging type tags of a host extension archive (legacy and current name)
inline constexpr const char* HOST_EXTENSION_TYPE_LEGACY = "hpi";
inline constexpr const char* HOST_EXTENSION_TYPE = "jpi";

bool is_host_extension_type(const std::string& type);

// Pure function of the artifact's declared packaging type
ArtifactKind classify(const ResolvedArtifact& artifact);

inline bool is_host_extension(const ResolvedArtifact& artifact) {
    return classify(artifact) == ArtifactKind::HostExtension;
}

} // namespace jpi
