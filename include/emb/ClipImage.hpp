#pragma once
#include <string>
#include <vector>

namespace emb {

// Decodes a local image and produces the CLIP input tensor: shortest side
// resized to fit, center crop HxW, RGB, mean/std normalized, CHW float32.
// Returns false if the file cannot be decoded.
bool load_clip_image(const std::string& path, int H, int W, std::vector<float>& chw);

// only local files are embeddable; remote references need a fetch first
bool is_local_image_ref(const std::string& ref);

} // namespace emb
