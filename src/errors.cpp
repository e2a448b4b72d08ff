#include "acp/errors.hpp"


namespace acp {

const char* to_code(ErrorKind kind) {
	switch (kind) {
	case ErrorKind::None: return "OK";
	case ErrorKind::PlatformUnsupported: return "PLATFORM_UNSUPPORTED";
	case ErrorKind::RadioUnavailable: return "BLUETOOTH_NOT_ENABLED";
	case ErrorKind::PermissionDenied: return "PERMISSION_DENIED";
	case ErrorKind::PermissionPermanentlyDenied: return "PERMISSION_PERMANENTLY_DENIED";
	case ErrorKind::NativeCapabilityUnavailable: return "NATIVE_ADVERTISER_UNAVAILABLE";
	case ErrorKind::RetryExhausted: return "RETRY_EXHAUSTED";
	case ErrorKind::DeviceNotConnected: return "DEVICE_NOT_CONNECTED";
	case ErrorKind::ServiceNotFound: return "SERVICE_NOT_FOUND";
	case ErrorKind::CharacteristicNotFound: return "CHARACTERISTIC_NOT_FOUND";
	case ErrorKind::OperationTimeout: return "OPERATION_TIMEOUT";
	case ErrorKind::OperationInProgress: return "OPERATION_IN_PROGRESS";
	case ErrorKind::Cancelled: return "OPERATION_CANCELLED";
	case ErrorKind::InvalidPayload: return "INVALID_PAYLOAD";
	case ErrorKind::InvalidConfig: return "INVALID_CONFIG";
	case ErrorKind::ScanError: return "SCAN_ERROR";
	case ErrorKind::ConnectionFailed: return "CONNECTION_ERROR";
	case ErrorKind::SendFailed: return "SEND_DATA_ERROR";
	case ErrorKind::ListenerFailed: return "LISTENER_ERROR";
	case ErrorKind::BleNotAvailable: return "BLE_NOT_AVAILABLE";
	case ErrorKind::AlreadyInstantiated: return "ALREADY_INSTANTIATED";
	}
	return "UNKNOWN";
}

} // namespace acp
