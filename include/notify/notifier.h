#pragma once

#include "core/types.h"

// Получатель алертов. false или исключение - доставка не удалась;
// вызывающий логирует и продолжает работу.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual bool notify(const AlertEvent& event) = 0;
};
