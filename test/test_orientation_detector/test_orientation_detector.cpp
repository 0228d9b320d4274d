/**
 * @file test_orientation_detector.cpp
 * @brief Unit tests for flip detection: debounce, hysteresis, publish and teardown
 */

#include <unity.h>
#include <memory>
#include <vector>
#include "FakeSampleSource.hpp"
#include "OrientationDetector.hpp"

static std::vector<bool> published;

static DetectorConfig tilt_config() {
    return DetectorConfig::defaults_for(SampleKind::TiltDegrees);
}

static DetectorConfig accel_config() {
    return DetectorConfig::defaults_for(SampleKind::AccelerationZ);
}

static void feed(FakeSampleSource& src, std::initializer_list<float> values) {
    for (float v : values) src.emit(v);
}

static void record(bool flipped) {
    published.push_back(flipped);
}

void setUp(void) {
    published.clear();
}

void tearDown(void) {}

// ============================================================================
// Configuration
// ============================================================================

void test_defaults_per_kind(void) {
    DetectorConfig a = accel_config();
    TEST_ASSERT_EQUAL_FLOAT(0.25f, a.ema_alpha);
    TEST_ASSERT_EQUAL_FLOAT(-0.6f, a.enter_threshold);
    TEST_ASSERT_EQUAL_FLOAT(-0.2f, a.exit_threshold);
    TEST_ASSERT_EQUAL_INT(3, a.stable_required);
    TEST_ASSERT_EQUAL_INT(100, a.sample_interval_ms);

    DetectorConfig t = tilt_config();
    TEST_ASSERT_EQUAL_FLOAT(150.0f, t.enter_threshold);
    TEST_ASSERT_EQUAL_FLOAT(30.0f, t.exit_threshold);
    TEST_ASSERT_EQUAL_INT(3, t.stable_required);
}

static bool rejects(const DetectorConfig& cfg) {
    FakeSampleSource src(cfg.kind);
    try {
        OrientationDetector det(src, cfg);
    } catch (const ConfigError&) {
        return src.subscribe_calls == 0;
    }
    return false;
}

void test_rejects_crossed_acceleration_thresholds(void) {
    DetectorConfig cfg = accel_config();
    cfg.enter_threshold = -0.1f;
    cfg.exit_threshold = -0.5f;
    TEST_ASSERT_TRUE(rejects(cfg));

    cfg.enter_threshold = -0.3f;
    cfg.exit_threshold = -0.3f;
    TEST_ASSERT_TRUE(rejects(cfg));
}

void test_rejects_crossed_tilt_thresholds(void) {
    DetectorConfig cfg = tilt_config();
    cfg.enter_threshold = 20.0f;
    cfg.exit_threshold = 40.0f;
    TEST_ASSERT_TRUE(rejects(cfg));
}

void test_rejects_non_positive_stable_required(void) {
    DetectorConfig cfg = tilt_config();
    cfg.stable_required = 0;
    TEST_ASSERT_TRUE(rejects(cfg));
    cfg.stable_required = -2;
    TEST_ASSERT_TRUE(rejects(cfg));
}

void test_rejects_alpha_out_of_range(void) {
    DetectorConfig cfg = accel_config();
    cfg.ema_alpha = 0.0f;
    TEST_ASSERT_TRUE(rejects(cfg));
    cfg.ema_alpha = 1.5f;
    TEST_ASSERT_TRUE(rejects(cfg));
}

void test_rejects_source_of_other_kind(void) {
    FakeSampleSource src(SampleKind::TiltDegrees);
    bool threw = false;
    try {
        OrientationDetector det(src, accel_config());
    } catch (const ConfigError&) {
        threw = true;
    }
    TEST_ASSERT_TRUE(threw);
    TEST_ASSERT_FALSE(src.subscribed());
}

// ============================================================================
// Lifecycle
// ============================================================================

void test_subscribes_on_construction(void) {
    FakeSampleSource src(SampleKind::AccelerationZ);
    OrientationDetector det(src, accel_config());

    TEST_ASSERT_TRUE(src.subscribed());
    TEST_ASSERT_EQUAL_INT(100, src.requested_interval_ms);
    TEST_ASSERT_TRUE(det.active());
    TEST_ASSERT_FALSE(det.current_state());

    // keeps its own copy of the settings it was built with
    TEST_ASSERT_EQUAL(SampleKind::AccelerationZ, det.config().kind);
    TEST_ASSERT_EQUAL_FLOAT(-0.6f, det.config().enter_threshold);
    TEST_ASSERT_EQUAL_INT(3, det.config().stable_required);
}

void test_unavailable_source_leaves_detector_inert(void) {
    FakeSampleSource src(SampleKind::TiltDegrees, false);
    OrientationDetector det(src, tilt_config());
    det.add_observer(record);

    TEST_ASSERT_FALSE(det.active());
    for (int i = 0; i < 10; i++) {
        Sample s;
        s.valid = true;
        s.value = 175.0f;
        det.on_sample(s);
    }
    TEST_ASSERT_EQUAL_size_t(0, published.size());
    TEST_ASSERT_FALSE(det.current_state());
}

void test_destructor_unsubscribes(void) {
    FakeSampleSource src(SampleKind::TiltDegrees);
    {
        OrientationDetector det(src, tilt_config());
        TEST_ASSERT_TRUE(src.subscribed());
    }
    TEST_ASSERT_FALSE(src.subscribed());
    TEST_ASSERT_EQUAL_INT(1, src.unsubscribe_calls);
}

// ============================================================================
// Scenarios
// ============================================================================

void test_tilt_flip_and_unflip_scenario(void) {
    FakeSampleSource src(SampleKind::TiltDegrees);
    OrientationDetector det(src, tilt_config());
    det.add_observer(record);

    feed(src, {170.0f, 172.0f});
    TEST_ASSERT_EQUAL_size_t(0, published.size());
    feed(src, {175.0f});
    TEST_ASSERT_EQUAL_size_t(1, published.size());
    TEST_ASSERT_TRUE(published[0]);
    TEST_ASSERT_TRUE(det.current_state());

    feed(src, {10.0f, 12.0f});
    TEST_ASSERT_EQUAL_size_t(1, published.size());
    TEST_ASSERT_TRUE(det.current_state());

    feed(src, {5.0f});
    TEST_ASSERT_EQUAL_size_t(2, published.size());
    TEST_ASSERT_FALSE(published[1]);
    TEST_ASSERT_FALSE(det.current_state());
}

void test_tilt_uses_absolute_angle(void) {
    FakeSampleSource src(SampleKind::TiltDegrees);
    OrientationDetector det(src, tilt_config());
    det.add_observer(record);

    feed(src, {-170.0f, 178.0f, -179.0f});
    TEST_ASSERT_EQUAL_size_t(1, published.size());
    TEST_ASSERT_TRUE(det.current_state());
}

void test_acceleration_scenario_from_level_start(void) {
    FakeSampleSource src(SampleKind::AccelerationZ);
    OrientationDetector det(src, accel_config());
    det.add_observer(record);

    // seeds the average at 0, which already counts as face up
    src.emit(0.0f);
    TEST_ASSERT_EQUAL_INT(1, det.counters().unflip);

    src.emit(-5.0f);   // ema -1.25
    src.emit(-5.0f);   // ema -2.1875
    TEST_ASSERT_EQUAL_INT(2, det.counters().flip);
    TEST_ASSERT_EQUAL_size_t(0, published.size());

    src.emit(-5.0f);   // ema ~-2.89
    TEST_ASSERT_EQUAL_size_t(1, published.size());
    TEST_ASSERT_TRUE(published[0]);
}

void test_acceleration_thresholds_filtered_value(void) {
    FakeSampleSource src(SampleKind::AccelerationZ);
    OrientationDetector det(src, accel_config());
    det.add_observer(record);

    // face up for a while, then a single spike down is absorbed by the EMA
    feed(src, {9.8f, 9.8f, 9.8f, 9.8f});
    src.emit(-9.8f);   // ema 4.9
    TEST_ASSERT_EQUAL_INT(0, det.counters().flip);
    feed(src, {9.8f, 9.8f});
    TEST_ASSERT_EQUAL_size_t(0, published.size());

    // sustained face down: the average has to cross -0.6 before counting
    for (int i = 0; i < 20; i++) src.emit(-9.8f);
    TEST_ASSERT_EQUAL_size_t(1, published.size());
    TEST_ASSERT_TRUE(det.current_state());

    for (int i = 0; i < 20; i++) src.emit(9.8f);
    TEST_ASSERT_EQUAL_size_t(2, published.size());
    TEST_ASSERT_FALSE(det.current_state());
}

void test_teardown_mid_stream_stops_everything(void) {
    FakeSampleSource src(SampleKind::TiltDegrees);
    OrientationDetector det(src, tilt_config());
    det.add_observer(record);

    feed(src, {170.0f, 170.0f});
    det.destroy();

    TEST_ASSERT_FALSE(src.subscribed());
    TEST_ASSERT_TRUE(det.destroyed());
    TEST_ASSERT_FALSE(src.emit(170.0f));

    // straight into the handler, bypassing the source
    for (int i = 0; i < 5; i++) {
        Sample s;
        s.valid = true;
        s.value = 170.0f;
        det.on_sample(s);
    }
    TEST_ASSERT_EQUAL_size_t(0, published.size());
    TEST_ASSERT_FALSE(det.current_state());

    // terminal: new observers are not accepted
    TEST_ASSERT_EQUAL_INT(0, det.add_observer(record));
    det.destroy();
    TEST_ASSERT_EQUAL_INT(1, src.unsubscribe_calls);
}

// ============================================================================
// Debounce and hysteresis
// ============================================================================

void test_repeated_confirmation_publishes_once(void) {
    FakeSampleSource src(SampleKind::TiltDegrees);
    OrientationDetector det(src, tilt_config());
    det.add_observer(record);

    for (int i = 0; i < 25; i++) src.emit(170.0f);
    TEST_ASSERT_EQUAL_size_t(1, published.size());
    TEST_ASSERT_EQUAL_INT(25, det.counters().flip);
}

void test_dead_zone_never_publishes(void) {
    FakeSampleSource src(SampleKind::TiltDegrees);
    OrientationDetector det(src, tilt_config());
    det.add_observer(record);

    for (int i = 0; i < 200; i++) {
        src.emit((i % 2) ? 31.0f : 149.0f);
    }
    TEST_ASSERT_EQUAL_size_t(0, published.size());
    TEST_ASSERT_EQUAL_INT(0, det.counters().flip);
    TEST_ASSERT_EQUAL_INT(0, det.counters().unflip);
}

void test_dead_zone_keeps_published_state(void) {
    FakeSampleSource src(SampleKind::TiltDegrees);
    OrientationDetector det(src, tilt_config());
    det.add_observer(record);

    feed(src, {170.0f, 170.0f, 170.0f});
    for (int i = 0; i < 50; i++) src.emit(90.0f);
    TEST_ASSERT_EQUAL_size_t(1, published.size());
    TEST_ASSERT_TRUE(det.current_state());
}

void test_opposite_sample_blocks_premature_flip(void) {
    FakeSampleSource src(SampleKind::TiltDegrees);
    OrientationDetector det(src, tilt_config());
    det.add_observer(record);

    feed(src, {170.0f, 170.0f, 10.0f, 170.0f, 170.0f});
    TEST_ASSERT_EQUAL_size_t(0, published.size());

    src.emit(170.0f);
    TEST_ASSERT_EQUAL_size_t(1, published.size());
}

void test_exit_sample_zeroes_flip_count(void) {
    FakeSampleSource src(SampleKind::TiltDegrees);
    OrientationDetector det(src, tilt_config());

    feed(src, {170.0f, 170.0f});
    TEST_ASSERT_EQUAL_INT(2, det.counters().flip);

    src.emit(10.0f);
    TEST_ASSERT_EQUAL_INT(0, det.counters().flip);
    TEST_ASSERT_EQUAL_INT(1, det.counters().unflip);
}

void test_dead_zone_decays_instead_of_clearing(void) {
    FakeSampleSource src(SampleKind::TiltDegrees);
    OrientationDetector det(src, tilt_config());
    det.add_observer(record);

    feed(src, {170.0f, 170.0f});
    src.emit(90.0f);
    TEST_ASSERT_EQUAL_INT(1, det.counters().flip);

    src.emit(170.0f);
    TEST_ASSERT_EQUAL_size_t(0, published.size());
    src.emit(170.0f);
    TEST_ASSERT_EQUAL_size_t(1, published.size());
}

void test_counters_never_both_nonzero(void) {
    FakeSampleSource src(SampleKind::TiltDegrees);
    OrientationDetector det(src, tilt_config());

    const float pattern[] = {170, 90, 10, 10, 100, 175, 20, 160, 160, 45, 5, 179};
    for (int round = 0; round < 5; round++) {
        for (float v : pattern) {
            src.emit(v);
            TEST_ASSERT_TRUE(det.counters().flip == 0 || det.counters().unflip == 0);
            TEST_ASSERT_TRUE(det.counters().flip >= 0 && det.counters().unflip >= 0);
        }
    }
}

void test_stable_required_of_one(void) {
    FakeSampleSource src(SampleKind::TiltDegrees);
    DetectorConfig cfg = tilt_config();
    cfg.stable_required = 1;
    OrientationDetector det(src, cfg);
    det.add_observer(record);

    src.emit(170.0f);
    src.emit(10.0f);
    TEST_ASSERT_EQUAL_size_t(2, published.size());
    TEST_ASSERT_TRUE(published[0]);
    TEST_ASSERT_FALSE(published[1]);
}

void test_absent_samples_are_dropped(void) {
    FakeSampleSource src(SampleKind::TiltDegrees);
    OrientationDetector det(src, tilt_config());
    det.add_observer(record);

    feed(src, {170.0f, 170.0f});
    src.emit_gap();
    src.emit_gap();
    TEST_ASSERT_EQUAL_INT(2, det.counters().flip);

    src.emit(170.0f);
    TEST_ASSERT_EQUAL_size_t(1, published.size());
}

// ============================================================================
// Observers
// ============================================================================

void test_observers_called_in_registration_order(void) {
    FakeSampleSource src(SampleKind::TiltDegrees);
    OrientationDetector det(src, tilt_config());

    std::vector<int> order;
    det.add_observer([&](bool) { order.push_back(1); });
    det.add_observer([&](bool) { order.push_back(2); });
    det.add_observer([&](bool) { order.push_back(3); });

    feed(src, {170.0f, 170.0f, 170.0f});
    TEST_ASSERT_EQUAL_size_t(3, order.size());
    TEST_ASSERT_EQUAL_INT(1, order[0]);
    TEST_ASSERT_EQUAL_INT(2, order[1]);
    TEST_ASSERT_EQUAL_INT(3, order[2]);
}

void test_removed_observer_not_called(void) {
    FakeSampleSource src(SampleKind::TiltDegrees);
    OrientationDetector det(src, tilt_config());

    int calls = 0;
    OrientationDetector::ObserverId id = det.add_observer([&](bool) { calls++; });
    det.add_observer(record);
    det.remove_observer(id);
    det.remove_observer(id);       // already gone
    det.remove_observer(12345);    // never registered

    feed(src, {170.0f, 170.0f, 170.0f});
    TEST_ASSERT_EQUAL_INT(0, calls);
    TEST_ASSERT_EQUAL_size_t(1, published.size());
}

void test_observer_may_remove_itself(void) {
    FakeSampleSource src(SampleKind::TiltDegrees);
    OrientationDetector det(src, tilt_config());

    int calls = 0;
    OrientationDetector::ObserverId id = 0;
    id = det.add_observer([&](bool) {
        calls++;
        det.remove_observer(id);
    });
    det.add_observer(record);

    feed(src, {170.0f, 170.0f, 170.0f, 10.0f, 10.0f, 10.0f});
    TEST_ASSERT_EQUAL_INT(1, calls);
    TEST_ASSERT_EQUAL_size_t(2, published.size());
}

void test_observer_may_tear_down_detector(void) {
    FakeSampleSource src(SampleKind::TiltDegrees);
    OrientationDetector det(src, tilt_config());

    det.add_observer([&](bool) { det.destroy(); });
    det.add_observer(record);

    feed(src, {170.0f, 170.0f, 170.0f});
    TEST_ASSERT_TRUE(det.destroyed());
    TEST_ASSERT_FALSE(src.subscribed());
    TEST_ASSERT_EQUAL_size_t(0, published.size());
}

int main(int argc, char **argv) {
    UNITY_BEGIN();

    // Configuration
    RUN_TEST(test_defaults_per_kind);
    RUN_TEST(test_rejects_crossed_acceleration_thresholds);
    RUN_TEST(test_rejects_crossed_tilt_thresholds);
    RUN_TEST(test_rejects_non_positive_stable_required);
    RUN_TEST(test_rejects_alpha_out_of_range);
    RUN_TEST(test_rejects_source_of_other_kind);

    // Lifecycle
    RUN_TEST(test_subscribes_on_construction);
    RUN_TEST(test_unavailable_source_leaves_detector_inert);
    RUN_TEST(test_destructor_unsubscribes);

    // Scenarios
    RUN_TEST(test_tilt_flip_and_unflip_scenario);
    RUN_TEST(test_tilt_uses_absolute_angle);
    RUN_TEST(test_acceleration_scenario_from_level_start);
    RUN_TEST(test_acceleration_thresholds_filtered_value);
    RUN_TEST(test_teardown_mid_stream_stops_everything);

    // Debounce and hysteresis
    RUN_TEST(test_repeated_confirmation_publishes_once);
    RUN_TEST(test_dead_zone_never_publishes);
    RUN_TEST(test_dead_zone_keeps_published_state);
    RUN_TEST(test_opposite_sample_blocks_premature_flip);
    RUN_TEST(test_exit_sample_zeroes_flip_count);
    RUN_TEST(test_dead_zone_decays_instead_of_clearing);
    RUN_TEST(test_counters_never_both_nonzero);
    RUN_TEST(test_stable_required_of_one);
    RUN_TEST(test_absent_samples_are_dropped);

    // Observers
    RUN_TEST(test_observers_called_in_registration_order);
    RUN_TEST(test_removed_observer_not_called);
    RUN_TEST(test_observer_may_remove_itself);
    RUN_TEST(test_observer_may_tear_down_detector);

    return UNITY_END();
}
