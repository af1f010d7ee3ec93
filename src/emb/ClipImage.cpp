#include "emb/ClipImage.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace emb {

static const float kMean[3] = {0.48145466f, 0.4578275f, 0.40821073f};
static const float kStd[3]  = {0.26862954f, 0.26130258f, 0.27577711f};

bool is_local_image_ref(const std::string& ref) {
    if (ref.empty()) return false;
    return ref.find("://") == std::string::npos;
}

static bool preprocess(const cv::Mat& bgr, int H, int W, std::vector<float>& chw) {
    cv::Mat rgb;
    cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);

    // scale so the crop fits on both axes
    const float scale = std::max(float(W) / float(rgb.cols), float(H) / float(rgb.rows));
    const int rw = std::max(W, int(std::round(rgb.cols * scale)));
    const int rh = std::max(H, int(std::round(rgb.rows * scale)));

    cv::Mat resized;
    cv::resize(rgb, resized, cv::Size(rw, rh), 0, 0, cv::INTER_CUBIC);

    const int x = (resized.cols - W) / 2;
    const int y = (resized.rows - H) / 2;
    cv::Mat crop = resized(cv::Rect(x, y, W, H)).clone();

    crop.convertTo(crop, CV_32FC3, 1.0 / 255.0);

    std::vector<cv::Mat> ch(3);
    cv::split(crop, ch);

    const size_t plane = (size_t)H * (size_t)W;
    chw.assign(3 * plane, 0.0f);
    for (int c = 0; c < 3; ++c) {
        cv::Mat norm = (ch[c] - kMean[c]) / kStd[c];
        if (!norm.isContinuous()) norm = norm.clone();
        std::memcpy(chw.data() + c * plane, norm.ptr<float>(0), plane * sizeof(float));
    }
    return true;
}

bool load_clip_image(const std::string& path, int H, int W, std::vector<float>& chw) {
    if (H <= 0 || W <= 0) return false;

    try {
        cv::Mat bgr = cv::imread(path, cv::IMREAD_COLOR);
        if (bgr.empty()) return false;
        return preprocess(bgr, H, W, chw);
    } catch (const cv::Exception& e) {
        std::cerr << "load_clip_image: " << path << ": " << e.what() << "\n";
        return false;
    }
}

} // namespace emb
