#pragma once

#include <mutex>
#include <string>

#include "notify/notifier.h"

// Дописывает одну JSON-строку на алерт в файл (JSONL).
class EventLogNotifier : public Notifier {
public:
    explicit EventLogNotifier(std::string path);

    bool notify(const AlertEvent& event) override;

    static std::string to_json(const AlertEvent& event);

private:
    std::string path_;
    std::mutex mu_;
};
