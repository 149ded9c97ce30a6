#pragma once

#include <string>

#include "core/types.h"

enum class ReadStatus {
    Ok,
    Timeout,     // - за timeout_ms кадра не было (источник жив).
    EndOfStream  // - поток закончился (файл), повторять нет смысла.
};

// Источник кадров одной камеры. Один экземпляр может открываться повторно
// после close(). Ошибки -> AcquisitionError (fatal() различает Fatal/Transient).
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual void open() = 0;

    // Ждёт следующий кадр не дольше timeout_ms. Заполняет out.image и out.ts_ms.
    virtual ReadStatus read(Frame& out, int timeout_ms) = 0;

    // Идемпотентно.
    virtual void close() = 0;

    virtual std::string describe() const = 0;
};
