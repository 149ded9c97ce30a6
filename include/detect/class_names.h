#pragma once

#include <string>
#include <vector>

// 80 классов COCO в порядке обучения YOLO.
const std::vector<std::string>& coco_class_names();

// Один класс на строку, пустые строки пропускаются. Бросает ConfigError.
std::vector<std::string> load_class_names(const std::string& path);

// Пустой путь -> COCO-80.
std::vector<std::string> resolve_class_names(const std::string& path);
