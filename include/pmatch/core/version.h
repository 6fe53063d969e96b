#pragma once

namespace pmatch::core {

// kArtifactVersion is written into every match artifact. Bump on any change to the
// artifact layout or to scoring semantics.
constexpr const char* kArtifactVersion = "1.0";

}  // namespace pmatch::core
