#pragma once
#include "acp/event_loop.hpp"
#include "acp/log_sink.hpp"
#include "acp/types.hpp"
#include "config/acp_config.h"
#include <map>
#include <optional>
#include <string>
#include <vector>


namespace acp {

struct SecurityConfig {
	bool enable_encryption{ false };
	bool enable_authentication{ false };
	std::string encryption_key;       ///< 비어 있으면 암호화 생략
	Millis session_timeout{ ACP_AUTH_TOKEN_TTL_MS };
};


struct SecurityMetrics {
	uint32_t encryption_attempts{ 0 };
	uint32_t successful_encryptions{ 0 };
	uint32_t failed_encryptions{ 0 };
	uint32_t authentication_attempts{ 0 };
	uint32_t successful_authentications{ 0 };
	uint32_t failed_authentications{ 0 };
	std::vector<std::string> errors;
};


struct SecurityStatistics {
	size_t total_sessions{ 0 };
	uint32_t successful_encryptions{ 0 };
	uint32_t successful_authentications{ 0 };
	uint32_t failed_encryptions{ 0 };
	uint32_t failed_authentications{ 0 };
	double average_security_errors{ 0.0 };
	double encryption_success_rate{ 0.0 };     ///< %
	double authentication_success_rate{ 0.0 }; ///< %
};


/**
* SecurityLayer
* - 필드 단위 반복 키 XOR + base64 (자리표시자 암호. 인터페이스는 고정, 알고리즘은 교체 대상)
* - 기기별 인증 토큰 (TTL 만료 시 검증 실패 + 삭제)
* - 세션별 보안 메트릭
*/
class SecurityLayer {
public:
	explicit SecurityLayer(EventLoop& loop, LogSink* log = nullptr);

	struct SecureResult {
		PaymentPayload payload;
		bool encrypted{ false };
	};

	/** @brief walletAddress, amount 암호화. 암호화 꺼짐/키 없음이면 그대로 반환 */
	SecureResult create_secure_payload(const PaymentPayload& p, const SecurityConfig& cfg,
		const std::string& session_id = "");

	/** @brief 복호화 (메트릭 기록). 실패 시 nullopt */
	std::optional<PaymentPayload> decrypt_payload(const PaymentPayload& p, const std::string& key,
		const std::string& session_id = "");

	/** @brief 상태 없는 복호화 (스캐너용) */
	static bool decrypt_fields(const PaymentPayload& in, const std::string& key, PaymentPayload& out);

	static std::string xor_encode(const std::string& plain, const std::string& key);
	static bool xor_decode(const std::string& encoded, const std::string& key, std::string& out);

	std::string generate_auth_token(const std::string& device_name, Millis ttl = Millis(ACP_AUTH_TOKEN_TTL_MS),
		const std::string& session_id = "");
	bool validate_auth_token(const std::string& device_name, const std::string& token,
		const std::string& session_id = "");
	bool has_auth_token(const std::string& device_name) const;

	std::string generate_encryption_key(const std::string& device_name);
	std::optional<std::string> encryption_key(const std::string& device_name) const;

	void open_session(const std::string& session_id);
	/** @brief 세션 메트릭, 기기 토큰/키 삭제 후 만료 토큰 정리 */
	void close_session(const std::string& session_id, const std::string& device_name);
	size_t purge_expired();

	const SecurityMetrics* metrics(const std::string& session_id) const;
	SecurityStatistics statistics() const;

private:
	struct TokenEntry {
		std::string token;
		int64_t expires_at{ 0 }; ///< epoch ms
	};

	SecurityMetrics* session_(const std::string& session_id);
	void record_error_(const std::string& session_id, const std::string& msg);

	EventLoop& loop_;
	LogSink* log_ = nullptr;
	std::map<std::string, TokenEntry> tokens_;     ///< deviceName → token
	std::map<std::string, std::string> keys_;      ///< deviceName → key
	std::map<std::string, SecurityMetrics> metrics_; ///< sessionId → metrics
};

} // namespace acp
