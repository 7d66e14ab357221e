#include <cassert>
#include <cstring>
#include <iostream>
#include "TestTables.hpp"

void test_null_observer() {
    std::cout << "\nTesting null observer..." << std::endl;

    const auto table = TorqueCurve::table();
    vdlut::NullLookupObserver observer;

    for (double rpm = 500.0; rpm < 8000.0; rpm += 137.0) {
        const double plain = table.lookup(rpm);
        const double observed = table.lookup(rpm, observer);
        assert(std::memcmp(&plain, &observed, sizeof(double)) == 0);
    }

    const auto grip = GripSurface::table();
    for (double slip = -1.0; slip < 10.0; slip += 0.37) {
        for (double load = 1500.0; load < 4500.0; load += 230.0) {
            const double plain = grip.lookup(slip, load);
            const double observed = grip.lookup(slip, load, observer);
            assert(std::memcmp(&plain, &observed, sizeof(double)) == 0);
        }
    }

    const auto drag = DragCube::table();
    for (double speed = -5.0; speed < 110.0; speed += 7.3) {
        for (double yaw = -1.0; yaw < 12.0; yaw += 1.7) {
            for (double height = 0.03; height < 0.13; height += 0.011) {
                const double plain = drag.lookup(speed, yaw, height);
                const double observed = drag.lookup(speed, yaw, height, observer);
                assert(std::memcmp(&plain, &observed, sizeof(double)) == 0);
            }
        }
    }

    std::cout << "Observed lookups match plain lookups" << std::endl;
}

void test_recorder_samples() {
    std::cout << "\nTesting recorded samples..." << std::endl;

    vdlut::LookupRecorder<8> recorder;
    assert(recorder.empty());
    assert(recorder.capacity() == 8);

    const auto curve = TorqueCurve::table();
    const auto grip = GripSurface::table();
    const auto drag = DragCube::table();

    const double r1 = curve.lookup(4200.0, recorder);
    const double r2 = grip.lookup(2.0, 3000.0, recorder);
    const double r3 = drag.lookup(20.0, 5.0, 0.055, recorder);

    assert(recorder.size() == 3);
    assert(recorder.total() == 3);
    assert(recorder.dropped() == 0);

    assert(recorder[0].dimensions == 1);
    assert(recorder[0].coordinates[0] == 4200.0);
    assert(recorder[0].value == r1);

    assert(recorder[1].dimensions == 2);
    assert(recorder[1].coordinates[0] == 2.0 && recorder[1].coordinates[1] == 3000.0);
    assert(recorder[1].value == r2);

    assert(recorder[2].dimensions == 3);
    assert(recorder[2].coordinates[2] == 0.055);
    assert(recorder[2].value == r3);
    assert(recorder.latest().value == r3);

    std::cout << "Recorded samples passed" << std::endl;
}

void test_recorder_wraparound() {
    std::cout << "\nTesting recorder wraparound..." << std::endl;

    vdlut::LookupRecorder<4> recorder;
    const auto table = TorqueCurve::table();

    for (int i = 0; i < 6; ++i) {
        table.lookup(1000.0 + 1000.0 * i, recorder);
    }

    assert(recorder.size() == 4);
    assert(recorder.total() == 6);
    assert(recorder.dropped() == 2);

    // Oldest retained sample is the third lookup
    for (size_t i = 0; i < recorder.size(); ++i) {
        assert(recorder[i].coordinates[0] == 3000.0 + 1000.0 * i);
    }
    assert(recorder.latest().coordinates[0] == 6000.0);

    recorder.clear();
    assert(recorder.empty());
    assert(recorder.size() == 0);
    assert(recorder.dropped() == 0);

    std::cout << "Recorder wraparound passed" << std::endl;
}


int main() {
    try {
        test_null_observer();
        test_recorder_samples();
        test_recorder_wraparound();

        std::cout << "\nAll tests completed successfully!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
