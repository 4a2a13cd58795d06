/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for CSV loading through frame construction.
 *
 * Build:
 *   cmake -DRRG_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Parsed dates are strictly increasing and parallel to closes.
 *   3. Aligned tables satisfy the SeriesTable invariants.
 *   4. Metrics tables keep the input shape.
 *   5. Frames and steps are index-aligned.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "rrg/data_loader.hpp"
#include "rrg/frames.hpp"
#include "rrg/metrics.hpp"

using namespace rrg;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto series = io::DataLoader::parse_close_csv(input);
    if (!series) {
        return 0;
    }

    // Invariant 2
    assert(series->dates.size() == series->closes.size());
    assert(is_strictly_increasing(series->dates));

    // Use the same file as benchmark and instrument.
    const std::vector<io::NamedCloseSeries> inst{{"X", *series}};
    const auto aligned = io::DataLoader::align("B", *series, inst);
    assert(aligned.has_value());

    // Invariant 3
    assert(aligned->benchmark.index == aligned->instruments.index);
    assert(aligned->instruments.rows() == series->dates.size());

    const std::size_t window = 1 + (size % 7);
    const auto computed = metrics::MetricsEngine::compute(aligned->benchmark,
                                                     aligned->instruments, window);
    assert(computed.has_value());

    // Invariant 4
    assert(computed->ratio.rows() == aligned->instruments.rows());
    assert(computed->momentum.cols() == aligned->instruments.cols());

    const auto set = frames::FrameBuilder::build(computed->ratio, computed->momentum,
                                                 1 + (size % 5), size % 11);
    assert(set.has_value());

    // Invariant 5
    assert(set->frames.size() == set->steps.size());
    assert(!set->frames.empty());

    return 0;
}
