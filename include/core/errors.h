#pragma once

#include <stdexcept>
#include <string>

// Ошибка получения кадров. fatal() == true означает, что повтор бессмыслен
// без изменения конфигурации (нет плагина, пустой URL и т.п.).
class AcquisitionError : public std::runtime_error {
public:
    AcquisitionError(const std::string& what, bool fatal)
            : std::runtime_error(what), fatal_(fatal) {}

    bool fatal() const { return fatal_; }

private:
    bool fatal_;
};

// Цикл детекции пропускается, предыдущий набор треков остаётся как есть.
class DetectionError : public std::runtime_error {
public:
    explicit DetectionError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

class NotificationError : public std::runtime_error {
public:
    explicit NotificationError(const std::string& what) : std::runtime_error(what) {}
};

class RenderError : public std::runtime_error {
public:
    explicit RenderError(const std::string& what) : std::runtime_error(what) {}
};
