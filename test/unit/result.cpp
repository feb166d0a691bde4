/*
 * Result Tests
 *
 * Copyright (C) 2022 Julian Stecklina, Cyberus Technology GmbH.
 *
 * This file is part of the Palisade secure VM service.
 *
 * Palisade is free software: you can redistribute it and/or modify it
 * under the terms of the GNU General Public License version 2 as
 * published by the Free Software Foundation.
 *
 * Palisade is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License version 2 for more details.
 */

#include "result.hpp"

#include <catch2/catch.hpp>

namespace
{

enum class Decode_error
{
    OUT_OF_RANGE,
    RESERVED,
};

enum class Request_error
{
    BAD_PARAMETER,
};

using vector_result = Result<uint8, Decode_error>;

// Interpret a guest value as an interrupt vector.
vector_result decode_vector(uint64 value)
{
    if (value > 0xff) {
        return Err(Decode_error::OUT_OF_RANGE);
    }

    if (value < 16) {
        return Err(Decode_error::RESERVED);
    }

    return Ok(static_cast<uint8>(value));
}

Request_error to_request_error(Decode_error) { return Request_error::BAD_PARAMETER; }

} // namespace

TEST_CASE("Basic construction works", "[result]")
{
    auto const ok_result{decode_vector(0x40)};
    auto const err_result{decode_vector(0x100)};

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());

    CHECK(ok_result.unwrap() == 0x40);
    CHECK(ok_result.expect("should not fail") == 0x40);
    CHECK(err_result.unwrap_err() == Decode_error::OUT_OF_RANGE);
    CHECK(decode_vector(3).unwrap_err() == Decode_error::RESERVED);
}

TEST_CASE("Can instantiate Result with identical types", "[result]")
{
    auto ok_result{Result<int, int>::ok(12)};
    auto err_result{Result<int, int>::err(13)};

    CHECK(ok_result.unwrap() == 12);
    CHECK(err_result.unwrap_err() == 13);
}

TEST_CASE("Result copy and move construction works", "[result]")
{
    auto const source{decode_vector(0x1000)};
    auto copy{source};

    REQUIRE(copy.is_err());
    CHECK(copy.unwrap_err() == Decode_error::OUT_OF_RANGE);

    auto moved{move(copy)};

    REQUIRE(moved.is_err());
    CHECK(moved.unwrap_err() == Decode_error::OUT_OF_RANGE);
}

TEST_CASE("Result unwrap_or_else works", "[result]")
{
    CHECK(decode_vector(0x41).unwrap_or_else([]() { return 0; }) == 0x41);
    CHECK(decode_vector(0x141).unwrap_or_else([]() { return 0; }) == 0);
}

TEST_CASE("Result map and map_err work", "[result]")
{
    auto const priority{decode_vector(0x5a).map([](uint8 v) { return v >> 4; })};

    REQUIRE(priority.is_ok());
    CHECK(priority.unwrap() == 5);

    auto const mapped_err{decode_vector(0x300).map_err(to_request_error)};

    REQUIRE(mapped_err.is_err());
    CHECK(mapped_err.unwrap_err() == Request_error::BAD_PARAMETER);

    auto const mapped_ok{decode_vector(0x30).map_err(to_request_error)};

    REQUIRE(mapped_ok.is_ok());
    CHECK(mapped_ok.unwrap() == 0x30);
}

TEST_CASE("Result and_then works", "[result]")
{
    auto const next{[](uint8 v) { return decode_vector(v + 0x80U); }};

    CHECK(decode_vector(0x20).and_then(next).unwrap() == 0xa0);
    CHECK(decode_vector(0x90).and_then(next).unwrap_err() == Decode_error::OUT_OF_RANGE);
    CHECK(decode_vector(0x2).and_then(next).unwrap_err() == Decode_error::RESERVED);
}

TEST_CASE("TRY_OR_RETURN returns OK value", "[result]")
{
    auto test_fn{[](uint64 value) -> Result<unsigned, Request_error> {
        uint8 const vector{TRY_OR_RETURN(decode_vector(value).map_err(to_request_error))};
        return Ok(vector / 32U);
    }};

    auto test_result{test_fn(0xe0)};

    REQUIRE(test_result.is_ok());
    CHECK(test_result.unwrap() == 7);
}

TEST_CASE("TRY_OR_RETURN passes on error value", "[result]")
{
    auto test_fn{[](uint64 value) -> Result_void<Decode_error> {
        TRY_OR_RETURN(decode_vector(value));
        return Ok_void({});
    }};

    auto test_result{test_fn(0x1ff)};

    REQUIRE(test_result.is_err());
    CHECK(test_result.unwrap_err() == Decode_error::OUT_OF_RANGE);
}
