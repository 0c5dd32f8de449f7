#include "jpi/classifier.hpp"

#include <spdlog/spdlog.h>

namespace jpi {

bool is_host_extension_type(const std::string& type) {
    return type == HOST_EXTENSION_TYPE_LEGACY || type == HOST_EXTENSION_TYPE;
}

ArtifactKind classify(const ResolvedArtifact& artifact) {
    ArtifactKind kind = is_host_extension_type(artifact.type) ? ArtifactKind::HostExtension
                                                              : ArtifactKind::OrdinaryLibrary;
    spdlog::debug("classify {} ({}): {}", artifact.id.to_string(), artifact.type,
                  artifact_kind_to_string(kind));
    return kind;
}

} // namespace jpi
