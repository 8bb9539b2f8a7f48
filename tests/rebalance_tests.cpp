// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <mdown/core/segment_store.hpp>
#include <mdown/disk/file_writer.hpp>
#include "fake_transport.hpp"

using namespace mdown::core;
using mdown::test::TempDir;

namespace {

// Store over an allocated staging file, every segment open
struct Fixture {
    explicit Fixture(std::uint64_t total, std::uint32_t count)
        : store(total, count) {
        path = dir.file("staging");
        REQUIRE_FALSE(mdown::disk::FileWriter::allocate(path, total));
        REQUIRE_FALSE(store.open_all(path));
    }

    void fill(std::size_t index, std::uint64_t n) {
        std::vector<std::byte> data(static_cast<std::size_t>(n), std::byte{0x5A});
        auto written = store.at(index).write(data);
        REQUIRE(written.has_value());
    }

    std::uint64_t sum_remaining() const {
        std::uint64_t sum = 0;
        for (const auto& seg : store.segments()) {
            if (seg.is_active()) sum += seg.remaining();
        }
        return sum;
    }

    TempDir dir;
    std::string path;
    SegmentStore store;
};

} // namespace

TEST_CASE("SegmentStore - initial partition", "[rebalance]") {
    Fixture f(1000, 4);
    REQUIRE(f.store.size() == 4);
    CHECK(f.store.at(0).range() == ByteRange{0, 250});
    CHECK(f.store.at(3).range() == ByteRange{750, 1000});
    CHECK(f.store.active_count() == 4);
    CHECK(f.store.is_partition());
}

TEST_CASE("SegmentStore::busiest", "[rebalance]") {
    Fixture f(1000, 4);

    SECTION("First one wins ties") {
        CHECK(f.store.busiest() == std::optional<std::size_t>{0});
    }

    SECTION("Most remaining bytes") {
        f.fill(0, 200);
        f.fill(1, 10);
        f.fill(3, 10);
        CHECK(f.store.busiest() == std::optional<std::size_t>{2});
    }

    SECTION("Only active segments are considered") {
        f.store.retire(0, make_error_code(DownloadErrc::not_found));
        CHECK(f.store.busiest() == std::optional<std::size_t>{1});
    }
}

TEST_CASE("SegmentStore::rebalance - split", "[rebalance]") {
    Fixture f(1000, 4);

    // Segment 3 delivered [750, 1000); segment 0 has only just started
    f.fill(3, 250);
    f.fill(1, 200);
    f.fill(2, 200);
    REQUIRE(f.store.at(3).cursor() == 1000);

    auto before = f.sum_remaining();
    auto threshold = GENERATE(as<std::uint64_t>{}, 100, SPLIT_THRESHOLD_BYTES / 100);

    auto action = f.store.rebalance(3, threshold);
    REQUIRE(action == RebalanceAction::split);

    // Donor keeps the lower half, receiver takes [mid, old_end)
    CHECK(f.store.at(0).range() == ByteRange{0, 125});
    CHECK(f.store.at(3).range() == ByteRange{125, 250});
    CHECK(f.store.at(3).cursor() == 125);

    CHECK(f.sum_remaining() == before);
    CHECK(f.store.active_count() == 4);
    CHECK(f.store.split_count() == 1);
    CHECK(f.store.is_partition());
}

TEST_CASE("SegmentStore::rebalance - split uses the donor cursor", "[rebalance]") {
    Fixture f(1000, 2);
    f.fill(0, 500);
    f.fill(1, 101);

    REQUIRE(f.store.rebalance(0, 1) == RebalanceAction::split);

    // Donor [601, 1000) has 399 left: keeps 199, donates 200
    CHECK(f.store.at(1).range() == ByteRange{500, 800});
    CHECK(f.store.at(1).remaining() == 199);
    CHECK(f.store.at(0).range() == ByteRange{800, 1000});
    CHECK(f.store.is_partition());
}

TEST_CASE("SegmentStore::rebalance - close below threshold", "[rebalance]") {
    Fixture f(1000, 4);
    f.fill(3, 250);
    f.fill(0, 200);
    f.fill(1, 200);
    f.fill(2, 200);

    auto action = f.store.rebalance(3, 100);
    CHECK(action == RebalanceAction::close);
    CHECK(f.store.at(3).status() == SegmentStatus::closed);
    CHECK(f.store.active_count() == 3);
    CHECK(f.store.split_count() == 0);
    CHECK(f.store.is_partition());
}

TEST_CASE("SegmentStore - drained fires exactly once", "[rebalance]") {
    Fixture f(10, 2);
    int drained = 0;
    f.store.on_drained([&] { ++drained; });

    f.fill(0, 5);
    f.fill(1, 5);

    CHECK(f.store.rebalance(0, 1) == RebalanceAction::close);
    CHECK(drained == 0);
    CHECK(f.store.rebalance(1, 1) == RebalanceAction::close);
    CHECK(drained == 1);
    CHECK(f.store.drained());

    // Already terminated; nothing changes
    f.store.retire(1, make_error_code(DownloadErrc::connection_lost));
    CHECK(drained == 1);
    CHECK(f.store.failed_count() == 0);
}

TEST_CASE("SegmentStore - zero threshold still terminates", "[rebalance]") {
    Fixture f(3, 4);
    int drained = 0;
    f.store.on_drained([&] { ++drained; });

    // Segment 0 is empty; everything else holds a single byte
    REQUIRE(f.store.at(0).remaining() == 0);

    int rounds = 0;
    while (!f.store.drained() && rounds++ < 100) {
        for (std::size_t i = 0; i < f.store.size(); ++i) {
            auto& seg = f.store.at(i);
            if (!seg.is_active()) continue;
            if (seg.remaining() > 0) {
                f.fill(i, seg.remaining());
            }
            (void)f.store.rebalance(i, 0);
        }
    }

    CHECK(f.store.drained());
    CHECK(drained == 1);
    CHECK(f.store.is_partition());
}

TEST_CASE("SegmentStore - handed-back ranges are coalesced", "[rebalance]") {
    Fixture f(4'000, 2);

    // Segment 0 repeatedly finishes and takes half of segment 1
    for (int i = 0; i < 8; ++i) {
        f.fill(0, f.store.at(0).remaining());
        REQUIRE(f.store.rebalance(0, 1) == RebalanceAction::split);
        CHECK(f.store.finished_span_count() <= f.store.size());
        CHECK(f.store.is_partition());
    }
    CHECK(f.store.split_count() == 8);

    // [0, 2000) and everything segment 0 gave up above segment 1
    CHECK(f.store.finished_span_count() == 2);
}

TEST_CASE("SegmentStore::retire", "[rebalance]") {
    Fixture f(100, 2);
    f.store.retire(0, make_error_code(DownloadErrc::not_found));
    CHECK(f.store.failed_count() == 1);
    CHECK(f.store.active_count() == 1);
    CHECK(f.store.at(0).status() == SegmentStatus::failed);
    CHECK(f.store.at(0).error() == DownloadErrc::not_found);
}
