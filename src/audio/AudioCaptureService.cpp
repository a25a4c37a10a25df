#include "AudioCaptureService.h"

QString captureStatusName(CaptureStatus status) {
    switch (status) {
        case CaptureStatus::Ok: return QStringLiteral("Ok");
        case CaptureStatus::DeviceUnavailable: return QStringLiteral("DeviceUnavailable");
        case CaptureStatus::InvalidSettings: return QStringLiteral("InvalidSettings");
        case CaptureStatus::EncodeFailed: return QStringLiteral("EncodeFailed");
        case CaptureStatus::Cancelled: return QStringLiteral("Cancelled");
    }
    return QStringLiteral("Unknown");
}
