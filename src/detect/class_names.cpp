#include "detect/class_names.h"
#include "core/errors.h"

#include <fstream>

const std::vector<std::string>& coco_class_names() {
    static const std::vector<std::string> names = {
            "person", "bicycle", "car", "motorcycle", "airplane", "bus", "train", "truck",
            "boat", "traffic light", "fire hydrant", "stop sign", "parking meter", "bench",
            "bird", "cat", "dog", "horse", "sheep", "cow",
            "elephant", "bear", "zebra", "giraffe", "backpack", "umbrella",
            "handbag", "tie", "suitcase", "frisbee", "skis", "snowboard",
            "sports ball", "kite", "baseball bat", "baseball glove", "skateboard",
            "surfboard", "tennis racket", "bottle", "wine glass", "cup", "fork",
            "knife", "spoon", "bowl", "banana", "apple", "sandwich", "orange",
            "broccoli", "carrot", "hot dog", "pizza", "donut", "cake", "chair",
            "couch", "potted plant", "bed", "dining table", "toilet", "tv", "laptop",
            "mouse", "remote", "keyboard", "cell phone", "microwave", "oven", "toaster",
            "sink", "refrigerator", "book", "clock", "vase", "scissors", "teddy bear",
            "hair drier", "toothbrush"};
    return names;
}

std::vector<std::string> load_class_names(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        throw ConfigError("unable to open class names file: " + path);
    }
    std::vector<std::string> names;
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) names.push_back(line);
    }
    if (names.empty()) {
        throw ConfigError("class names file is empty: " + path);
    }
    return names;
}

std::vector<std::string> resolve_class_names(const std::string& path) {
    if (path.empty()) return coco_class_names();
    return load_class_names(path);
}
