#include <doctest/doctest.h>
#include "acp/health_monitor.hpp"
#include "mocks/manual_event_loop.hpp"
#include <string>

using namespace acp;


TEST_CASE("session bookkeeping feeds overall statistics") {
	ManualEventLoop loop;
	HealthMonitor hm(loop);

	hm.start_monitoring("s1", "AirChainPay-0001", "standard");
	hm.mark_success("s1");
	hm.record_transmission("s1", 120);
	hm.record_transmission("s1", 80);
	hm.record_signal_sample("s1", -40);
	hm.record_signal_sample("s1", -60);
	loop.advance(Millis(4000));
	hm.stop_monitoring("s1");

	hm.start_monitoring("s2", "AirChainPay-0001", "secure");
	hm.record_error("s2", ErrorKind::RetryExhausted, "gave up");
	hm.record_restart("s2");
	loop.advance(Millis(2000));

	const SessionHealth* s1 = hm.session("s1");
	REQUIRE(s1 != nullptr);
	CHECK_FALSE(s1->active);
	CHECK(s1->packets_sent == 2);
	CHECK(s1->bytes_transmitted == 200);
	CHECK(s1->duration_ms(loop.wall_ms()) == 4000);
	CHECK(s1->average_signal() == doctest::Approx(-50.0));

	OverallStatistics s = hm.overall_statistics();
	CHECK(s.total_sessions == 2);
	CHECK(s.active_sessions == 1);
	CHECK(s.total_errors == 1);
	CHECK(s.total_restarts == 1);
	CHECK(s.total_bytes_transmitted == 200);
	CHECK(s.success_rate == doctest::Approx(50.0));
	// 신호 샘플이 없는 세션은 평균에서 제외
	CHECK(s.average_signal_strength == doctest::Approx(-50.0));
	CHECK(s.average_session_duration_ms == doctest::Approx(3000.0));
}

TEST_CASE("empty monitor reports zeros") {
	ManualEventLoop loop;
	HealthMonitor hm(loop);
	OverallStatistics s = hm.overall_statistics();
	CHECK(s.total_sessions == 0);
	CHECK(s.success_rate == doctest::Approx(0.0));
	CHECK(hm.session("nope") == nullptr);

	// 없는 세션 기록은 무시
	hm.record_transmission("nope", 10);
	hm.stop_monitoring("nope");
	CHECK(hm.overall_statistics().total_bytes_transmitted == 0);
}

TEST_CASE("report lists totals and sessions") {
	ManualEventLoop loop;
	HealthMonitor hm(loop);
	hm.start_monitoring("adv-1", "AirChainPay-0001", "standard");
	hm.mark_success("adv-1");
	hm.record_transmission("adv-1", 64);

	const std::string r = hm.generate_report();
	CHECK(r.find("AirChainPay BLE Advertising Report") == 0);
	CHECK(r.find("Total Sessions: 1 (active 1)") != std::string::npos);
	CHECK(r.find("Success Rate: 100.0%") != std::string::npos);
	CHECK(r.find("Total Bytes Transmitted: 64") != std::string::npos);
	CHECK(r.find("adv-1 [standard] active") != std::string::npos);
}

TEST_CASE("event history is bounded") {
	ManualEventLoop loop;
	HealthMonitor hm(loop, nullptr, Millis(ACP_HEALTH_CHECK_PERIOD_MS), 5);
	hm.start_monitoring("s", "AirChainPay-0001", "standard");
	for (int i = 0; i < 10; ++i) hm.record_error("s", ErrorKind::ScanError, "e" + std::to_string(i));

	REQUIRE(hm.events().size() == 5);
	CHECK(hm.events().back().detail == "SCAN_ERROR: e9");
	CHECK(hm.events().front().detail == "SCAN_ERROR: e5");
	CHECK(hm.session("s")->error_count == 10);

	hm.clear();
	CHECK(hm.events().empty());
	CHECK(hm.overall_statistics().total_sessions == 0);
}

TEST_CASE("periodic checks run until the invariant breaks") {
	ManualEventLoop loop;
	HealthMonitor hm(loop, nullptr, Millis(1000));
	hm.start_monitoring("s", "AirChainPay-0001", "standard");

	bool healthy = true;
	int failures = 0;
	hm.start_health_checks("s", [&]() { return healthy; }, [&]() { ++failures; });
	CHECK(hm.health_checks_running());

	loop.advance(Millis(3000));
	CHECK(failures == 0);
	CHECK(hm.session("s")->error_count == 0);

	healthy = false;
	loop.advance(Millis(1000));
	CHECK(failures == 1);
	CHECK(hm.session("s")->error_count == 1);
	// 체크는 계속 돈다
	loop.advance(Millis(1000));
	CHECK(failures == 2);
}

TEST_CASE("failure handler may replace or stop the checks") {
	ManualEventLoop loop;
	HealthMonitor hm(loop, nullptr, Millis(1000));
	hm.start_monitoring("s", "AirChainPay-0001", "standard");

	int restarted_checks = 0;
	hm.start_health_checks("s", []() { return false; }, [&]() {
		hm.record_restart("s");
		hm.start_health_checks("s", [&]() { ++restarted_checks; return true; }, nullptr);
	});

	loop.advance(Millis(1000));
	CHECK(hm.session("s")->restart_count == 1);
	CHECK(hm.health_checks_running());
	loop.advance(Millis(2000));
	CHECK(restarted_checks == 2);
	CHECK(loop.pending_timers() == 1);

	hm.stop_monitoring("s");
	CHECK_FALSE(hm.health_checks_running());
	CHECK(loop.pending_timers() == 0);
}

TEST_CASE("scan sessions feed signal strength but not advertising outcomes") {
	ManualEventLoop loop;
	HealthMonitor hm(loop);

	hm.start_monitoring("adv", "AirChainPay-0001", "standard");
	hm.mark_success("adv");
	loop.advance(Millis(1000));
	hm.stop_monitoring("adv");

	for (int i = 0; i < 3; ++i) {
		const std::string id = "scan-" + std::to_string(i);
		hm.start_monitoring(id, "scanner", SCAN_SESSION_MODE);
		hm.record_signal_sample(id, -70);
		loop.advance(Millis(30000));
		hm.stop_monitoring(id);
	}

	OverallStatistics s = hm.overall_statistics();
	CHECK(s.total_sessions == 1);
	CHECK(s.scan_sessions == 3);
	CHECK(s.success_rate == doctest::Approx(100.0));
	CHECK(s.average_session_duration_ms == doctest::Approx(1000.0));
	CHECK(s.average_signal_strength == doctest::Approx(-70.0));

	const std::string rep = hm.generate_report();
	CHECK(rep.find("Scan Sessions: 3") != std::string::npos);
}

TEST_CASE("session history drops the oldest finished sessions") {
	ManualEventLoop loop;
	HealthMonitor hm(loop, nullptr, Millis(ACP_HEALTH_CHECK_PERIOD_MS), ACP_MAX_EVENT_HISTORY, 2);

	hm.start_monitoring("s1", "AirChainPay-0001", "standard");
	loop.advance(Millis(10));
	hm.stop_monitoring("s1");
	hm.start_monitoring("s2", "AirChainPay-0001", "standard");
	loop.advance(Millis(10));
	hm.start_monitoring("s3", "AirChainPay-0001", "standard");

	CHECK(hm.session("s1") == nullptr);
	CHECK(hm.session("s2") != nullptr);
	CHECK(hm.session("s3") != nullptr);
	CHECK(hm.overall_statistics().total_sessions == 2);

	// 진행 중인 세션은 버리지 않는다
	hm.start_monitoring("s4", "AirChainPay-0001", "standard");
	CHECK(hm.session("s2") != nullptr);
	CHECK(hm.overall_statistics().active_sessions == 3);
}
