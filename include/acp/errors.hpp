#pragma once
#include <stdexcept>
#include <string>


namespace acp {

/**
* 에러 분류
* - 권한/라디오 문제는 결과 구조체로, 연결/전송/리스너 문제는 BluetoothError 예외로 보고한다.
*/
enum class ErrorKind {
	None,
	PlatformUnsupported,
	RadioUnavailable,
	PermissionDenied,
	PermissionPermanentlyDenied,
	NativeCapabilityUnavailable,
	RetryExhausted,
	DeviceNotConnected,
	ServiceNotFound,
	CharacteristicNotFound,
	OperationTimeout,
	OperationInProgress,
	Cancelled,
	InvalidPayload,
	InvalidConfig,
	ScanError,
	ConnectionFailed,
	SendFailed,
	ListenerFailed,
	BleNotAvailable,
	AlreadyInstantiated,
};


/** @brief 외부로 노출되는 에러 코드 문자열 (예: "DEVICE_NOT_CONNECTED") */
const char* to_code(ErrorKind kind);


class BluetoothError : public std::runtime_error {
public:
	BluetoothError(ErrorKind kind, const std::string& message)
		: std::runtime_error(message), kind_(kind) {}

	ErrorKind kind() const { return kind_; }
	std::string code() const { return to_code(kind_); }

private:
	ErrorKind kind_;
};


// 백엔드 호출 결과
struct BackendStatus {
	bool ok{ true };
	ErrorKind error{ ErrorKind::None };
	std::string message;

	static BackendStatus success() { return {}; }
	static BackendStatus failure(ErrorKind kind, std::string msg) {
		BackendStatus s; s.ok = false; s.error = kind; s.message = std::move(msg);
		return s;
	}
};

} // namespace acp
