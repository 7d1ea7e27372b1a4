/**
 * @file test_reassembly_buffer.cpp
 * @brief Unit tests for the client-side ReassemblyBuffer.
 */

#include <catch2/catch.hpp>

#include <mapsync/transfer/reassembly_buffer.hpp>

#include "helpers/test_utils.hpp"

using namespace mapsync::transfer;
using namespace test_helpers;

TEST_CASE("ReassemblyBuffer completes when every slot is filled", "[transfer][reassembly]") {
    auto blob = make_pattern(100000);
    auto chunks = chunk(blob, 8192);
    ReassemblyBuffer buf(13, blob.size());

    for (std::size_t i = 0; i < chunks.size(); ++i) {
        REQUIRE_FALSE(buf.is_complete());
        REQUIRE(buf.apply(chunks[i].chunkIndex, chunks[i].payload) == ReassemblyBuffer::ApplyResult::Stored);
        REQUIRE(buf.chunks_received() == static_cast<std::int32_t>(i + 1));
    }

    REQUIRE(buf.is_complete());
    REQUIRE(buf.fraction_complete() == 1.0f);
    REQUIRE(buf.bytes_received() == blob.size());
    REQUIRE(buf.reassemble() == blob);
}

TEST_CASE("Duplicate chunks are ignored", "[transfer][reassembly]") {
    auto blob = make_pattern(20000);
    auto chunks = chunk(blob, 8192);
    ReassemblyBuffer buf(3, blob.size());

    REQUIRE(buf.apply(1, chunks[1].payload) == ReassemblyBuffer::ApplyResult::Stored);

    SECTION("same content") {
        REQUIRE(buf.apply(1, chunks[1].payload) == ReassemblyBuffer::ApplyResult::Duplicate);
        REQUIRE(buf.chunks_received() == 1);
        REQUIRE(buf.bytes_received() == chunks[1].payload.size());
    }

    SECTION("different content keeps the first") {
        REQUIRE(buf.apply(1, chunks[0].payload) == ReassemblyBuffer::ApplyResult::Duplicate);
        buf.apply(0, chunks[0].payload);
        buf.apply(2, chunks[2].payload);
        REQUIRE(buf.chunks_received() == 3);
        REQUIRE(buf.reassemble() == blob);
    }
}

TEST_CASE("Out of range chunks are rejected", "[transfer][reassembly]") {
    ReassemblyBuffer buf(2, std::nullopt);
    std::vector<std::uint8_t> payload{1, 2, 3};

    REQUIRE(buf.apply(-1, payload) == ReassemblyBuffer::ApplyResult::OutOfRange);
    REQUIRE(buf.apply(2, payload) == ReassemblyBuffer::ApplyResult::OutOfRange);
    REQUIRE(buf.chunks_received() == 0);
    REQUIRE_FALSE(buf.has_chunk(2));
}

TEST_CASE("Reassembling early throws", "[transfer][reassembly]") {
    ReassemblyBuffer buf(2, std::nullopt);
    std::vector<std::uint8_t> payload{1};
    buf.apply(0, payload);

    REQUIRE(buf.fraction_complete() == 0.5f);
    REQUIRE_THROWS_AS(buf.reassemble(), IncompleteTransfer);
}

TEST_CASE("reset and clear drop received chunks", "[transfer][reassembly]") {
    ReassemblyBuffer buf(2, std::nullopt);
    std::vector<std::uint8_t> payload{1};
    buf.apply(0, payload);

    buf.reset(4, 10);
    REQUIRE(buf.total_chunks() == 4);
    REQUIRE(buf.chunks_received() == 0);
    REQUIRE(buf.expected_size() == std::optional<std::size_t>(10));

    buf.clear();
    REQUIRE(buf.total_chunks() == 0);
    REQUIRE(buf.is_complete());
}
