/*
 * Generic Bitmap tests
 *
 * Copyright (C) 2020 Markus Partheymüller, Cyberus Technology GmbH.
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

// Include the class under test first to detect any missing includes early
#include <bitmap.hpp>

#include <catch2/catch.hpp>

#include <algorithm>
#include <cstring>
#include <iterator>
#include <vector>

namespace
{

// The layout of the APIC register file: 256 vectors in eight 32-bit words.
using Vectors = Bitmap<uint32, 256>;

} // namespace

TEST_CASE("Bits land in the APIC register word layout", "[bitmap]")
{
    Vectors bitmap{false};
    std::vector<uint32> expected(Vectors::words(), 0);
    std::vector<uint32> storage(Vectors::words(), 0);

    SECTION("First vector")
    {
        bitmap[0] = true;
        expected.at(0) = 1;
    }

    SECTION("Last vector")
    {
        bitmap[255] = true;
        expected.at(7) = 1U << 31;
    }

    SECTION("Vector in the middle")
    {
        bitmap[0x45] = true;
        expected.at(2) = 1U << 5;
    }

    memcpy(storage.data(), &bitmap, sizeof(uint32) * storage.size());
    CHECK(storage == expected);

    for (size_t w{0}; w < Vectors::words(); w++) {
        CHECK(bitmap.word(w) == expected.at(w));
    }
}

TEST_CASE("Words can be replaced", "[bitmap]")
{
    Vectors bitmap{true};

    bitmap.set_word(1, 0);
    bitmap.set_word(7, 0x80000001);

    CHECK(bitmap.get(31));
    CHECK_FALSE(bitmap.get(32));
    CHECK_FALSE(bitmap.get(63));
    CHECK(bitmap.get(224));
    CHECK_FALSE(bitmap.get(225));
    CHECK(bitmap.get(255));
}

TEST_CASE("Bitmap iterators work", "[bitmap]")
{
    constexpr size_t SIZE{8};
    Bitmap<mword, SIZE> bitmap{false};

    CHECK(bitmap.begin() != bitmap.end());
    CHECK(bitmap.size() == SIZE);

    auto it = bitmap.begin();
    std::advance(it, SIZE);
    CHECK(it == bitmap.end());

    bitmap.set(1, true);
    CHECK_FALSE(*bitmap.begin());
    CHECK(*++bitmap.begin());
    CHECK(std::count(bitmap.begin(), bitmap.end(), true) == 1);
}

TEST_CASE("Highest set bit is found in every word", "[bitmap]")
{
    Vectors bitmap{false};

    CHECK(bitmap.highest() == -1);
    CHECK(bitmap.empty());

    for (size_t v{0}; v < Vectors::size(); v++) {
        bitmap[v] = true;
        CHECK(bitmap.highest() == static_cast<long>(v));
    }

    // Clearing from the top walks the result down again.
    for (size_t v{Vectors::size()}; v-- > 1;) {
        bitmap[v] = false;
        CHECK(bitmap.highest() == static_cast<long>(v - 1));
    }

    CHECK_FALSE(bitmap.empty());
}

TEST_CASE("Next set bit is found across words", "[bitmap]")
{
    Vectors bitmap{false};

    bitmap[3] = true;
    bitmap[31] = true;
    bitmap[200] = true;

    CHECK(bitmap.next(0) == 3);
    CHECK(bitmap.next(3) == 3);
    CHECK(bitmap.next(4) == 31);
    CHECK(bitmap.next(32) == 200);
    CHECK(bitmap.next(201) == -1);
    CHECK(bitmap.next(256) == -1);
}

TEST_CASE("Bitmap atomic operations work", "[bitmap]")
{
    // We make the bitmap larger than a single mword.
    constexpr size_t SIZE{128};
    Bitmap<mword, SIZE> bitmap{false};

    SECTION("atomic_fetch works")
    {
        CHECK_FALSE(bitmap.atomic_fetch(100));
        bitmap[100] = true;
        CHECK(bitmap.atomic_fetch(100));
    }

    SECTION("atomic_fetch_set and atomic_fetch_clear return the previous value")
    {
        CHECK_FALSE(bitmap[100].atomic_fetch_set());
        CHECK(bitmap[100]);
        CHECK(bitmap[100].atomic_fetch_set());

        CHECK(bitmap[100].atomic_fetch_clear());
        CHECK_FALSE(bitmap[100]);
        CHECK_FALSE(bitmap[100].atomic_fetch_clear());
    }

    SECTION("atomic_clear works")
    {
        bitmap[100].atomic_clear();
        CHECK_FALSE(bitmap[100]);

        bitmap[100] = true;
        bitmap[100].atomic_clear();
        CHECK_FALSE(bitmap[100]);
    }

    SECTION("atomic_union works")
    {
        Bitmap<mword, SIZE> other_bitmap{false};
        other_bitmap[17] = true;
        other_bitmap[100] = true;

        bitmap[5] = true;
        bitmap.atomic_union(other_bitmap);

        CHECK(bitmap[5]);
        CHECK(bitmap[17]);
        CHECK(bitmap[100]);
        CHECK(std::count(bitmap.begin(), bitmap.end(), true) == 3);
    }

    SECTION("atomic_take empties the bitmap")
    {
        bitmap[17] = true;
        bitmap[100] = true;

        Bitmap<mword, SIZE> const copy{bitmap};
        Bitmap<mword, SIZE> const taken{bitmap.atomic_take()};

        CHECK(taken == copy);
        CHECK(bitmap.empty());
        CHECK(bitmap != copy);
    }
}
