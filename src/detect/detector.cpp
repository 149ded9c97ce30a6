#include "detect/detector.h"
#include "detect/dnn_detector.h"
#include "core/errors.h"

#ifdef LINGER_WITH_RKNN
#include "detect/rknn_detector.h"
#endif

std::shared_ptr<Detector> make_detector(const DetectorConfig& cfg) {
    if (cfg.backend == "opencv_dnn") {
        return std::make_shared<DnnDetector>(cfg);
    }
    if (cfg.backend == "rknn") {
#ifdef LINGER_WITH_RKNN
        return std::make_shared<RknnDetector>(cfg);
#else
        throw ConfigError("detector backend 'rknn' is not built in (LINGER_WITH_RKNN=OFF)");
#endif
    }
    throw ConfigError("unknown detector backend: " + cfg.backend);
}
