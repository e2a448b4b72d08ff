#pragma once

// ── 식별자 (광고/스캔 공유)
#define ACP_SERVICE_UUID            "0000abcd-0000-1000-8000-00805f9b34fb"
#define ACP_CHARACTERISTIC_UUID     "0000abce-0000-1000-8000-00805f9b34fb"
#define ACP_DEVICE_PREFIX           "AirChainPay"
#define ACP_MESSAGE_TYPE            "AirChainPay"
#define ACP_MESSAGE_VERSION         "1.0.0"
#define ACP_MANUFACTURER_ID         0xFFFF
#define ACP_LEGACY_TAG              "ACP"
#define ACP_BEACON_VERSION          1
#define ACP_LEGACY_ADV_MAX_BYTES    31     // 레거시 AD / 스캔 응답 PDU 한도

// ── 광고
#define ACP_ADV_MAX_RETRIES         3
#define ACP_ADV_ATTEMPT_TIMEOUT_MS  8000
#define ACP_ADV_BACKOFF_BASE_MS     1000
#define ACP_ADV_FALLBACK_PERIOD_MS  1000
#define ACP_ADV_AUTO_STOP_MS        60000
#define ACP_ADV_STOP_TIMEOUT_MS     5000
#define ACP_RADIO_CHECK_ATTEMPTS    3
#define ACP_RADIO_CHECK_DELAY_MS    1000

// 광고 파라미터 기본값 / 허용 범위
#define ACP_TX_POWER_DEFAULT        0
#define ACP_TX_POWER_MIN            (-30)
#define ACP_TX_POWER_MAX            10
#define ACP_ADV_MODE_DEFAULT        2      // 0=저전력, 1=균형, 2=저지연
#define ACP_ADV_INTERVAL_DEFAULT_MS 100
#define ACP_ADV_INTERVAL_MIN_MS     20
#define ACP_ADV_INTERVAL_MAX_MS     10240

// ── 권한
#define ACP_PERMISSION_TIMEOUT_MS   5000

// ── 스캔
#define ACP_SCAN_TIMEOUT_MS         30000
#define ACP_HCI_INDEX               0

// ── 연결
#define ACP_CONNECT_MAX_RETRIES     3
#define ACP_CONNECT_BASE_DELAY_MS   1000
#define ACP_CONNECT_JITTER_MS       400
#define ACP_CONNECT_TIMEOUT_MS      30000

// ── 보안
#define ACP_AUTH_TOKEN_TTL_MS       (30 * 60 * 1000)

// ── 모니터링
#define ACP_HEALTH_CHECK_PERIOD_MS  30000
#define ACP_MAX_EVENT_HISTORY       1000
#define ACP_MAX_SESSION_HISTORY     100    // 종료 세션 보관 개수
