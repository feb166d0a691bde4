/*
 * Generic Bitmap
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

#pragma once

#include "assert.hpp"
#include "atomic.hpp"
#include "math.hpp"
#include "string.hpp"
#include "types.hpp"

#if __STDC_HOSTED__
#include <iterator>
#endif

/**
 * Simple Generic Bitmap
 *
 * Stores a given number of bits in an underlying array of the type T.
 */
template <typename T, size_t NUMBER_OF_BITS>
class Bitmap
{

        static constexpr size_t BITS_PER_WORD { sizeof(T) * 8 };

        static size_t word_index(size_t i) { return i / BITS_PER_WORD; }
        static size_t bit_index (size_t i) { return i % BITS_PER_WORD; }
        static T      bit_mask  (size_t i) { return static_cast<T>(1) << bit_index(i); }

        static constexpr size_t NUMBER_OF_WORDS { align_up(NUMBER_OF_BITS, BITS_PER_WORD) / BITS_PER_WORD };

        T bitmap_[NUMBER_OF_WORDS];
        static_assert(sizeof(bitmap_) * 8 >= NUMBER_OF_BITS, "Bitmap backing store too small for requests size");

    public:
        using value_type = T;

        /// Helper to simulate a bool reference
        class Bit_accessor
        {
            public:
                Bit_accessor() = delete;

                Bit_accessor(Bitmap &bitmap, size_t pos) : bitmap_(bitmap), pos_(pos)
                {
                    assert(pos < NUMBER_OF_BITS);
                }

                /// Assigns val to the corresponding bit
                void operator=(bool val)
                {
                    bitmap_.set(pos_, val);
                }

                operator bool() const
                {
                    return bitmap_.get(pos_);
                }

                /// Atomically set the bit and return its previous value.
                bool atomic_fetch_set()
                {
                    return Atomic::test_set_bit(bitmap_.bitmap_[word_index(pos_)], bit_index(pos_));
                }

                /// Atomically clear the bit and return its previous value.
                bool atomic_fetch_clear()
                {
                    return Atomic::test_clr_bit(bitmap_.bitmap_[word_index(pos_)], bit_index(pos_));
                }

                void atomic_clear()
                {
                    Atomic::clr_mask(bitmap_.bitmap_[word_index(pos_)], bit_mask(pos_));
                }

            private:
                Bitmap &bitmap_;
                size_t pos_;
        };

        /// A simple forward iterator for the bitmap class.
        class Iterator
        {
            public:
                using value_type = bool;
                using difference_type = ptrdiff_t;
                using pointer = void;
                using reference = Bit_accessor;

#if __STDC_HOSTED__
                using iterator_category = std::forward_iterator_tag;
#endif

                Iterator(Bitmap &bitmap, size_t pos) : bitmap_(bitmap), pos_(pos)
                {
                    // The "equal" case here handles the special
                    // one-past-the-end end() iterator.
                    assert(pos <= NUMBER_OF_BITS);
                }

                Bit_accessor operator*()
                {
                    return Bit_accessor {bitmap_, pos_};
                }

                Iterator operator++()
                {
                    pos_++;

                    return *this;
                }

                bool operator==(Iterator const &other) const
                {
                    assert(&bitmap_ == &other.bitmap_);
                    return pos_ == other.pos_;
                }

                bool operator!=(Iterator const &other) const
                {
                    return not (*this == other);
                }

            private:
                Bitmap &bitmap_;
                size_t pos_;
        };

        explicit Bitmap(bool initial_value)
        {
            memset(bitmap_, initial_value * 0xFF, sizeof(bitmap_));
        }

        /// Return an iterator to the first bit of the bitmap.
        Iterator begin()
        {
            return {*this, 0};
        }

        /// Return an iterator to the end bit of the bitmap.
        Iterator end()
        {
            return {*this, NUMBER_OF_BITS};
        }

        /// Return the size in bits of the bitmap.
        static size_t size()
        {
            return NUMBER_OF_BITS;
        }

        /// Obtain a bool-reference like object to access bit idx.
        Bit_accessor operator[](size_t i)
        {
            return {*this, i};
        }

        /// Set the given bit to a specified value.
        void set(size_t i, bool v)
        {
            assert(i < NUMBER_OF_BITS);
            bitmap_[word_index(i)] &= ~bit_mask(i);
            bitmap_[word_index(i)] |= v ? bit_mask(i) : 0;
        }

        /// Return the bit value at a specified position.
        bool get(size_t i) const
        {
            assert(i < NUMBER_OF_BITS);
            return bitmap_[word_index(i)] & bit_mask(i);
        }

        /// Atomically read the bit value at a specified position.
        bool atomic_fetch(size_t i) const
        {
            assert(i < NUMBER_OF_BITS);
            return Atomic::load(bitmap_[word_index(i)]) & bit_mask(i);
        }

        /// Merge another bitmap into this one.
        ///
        /// Each word is merged atomically, but the union as a whole is not. Concurrent observers may see a
        /// partially merged bitmap.
        void atomic_union(Bitmap const &other)
        {
            for (size_t w {0}; w < NUMBER_OF_WORDS; w++) {
                Atomic::set_mask(bitmap_[w], Atomic::load(other.bitmap_[w]));
            }
        }

        /// Atomically empty the bitmap word by word and return the bits that were set.
        ///
        /// Bits that are set concurrently end up either in the returned bitmap or remain set in this one.
        Bitmap atomic_take()
        {
            Bitmap taken {false};

            for (size_t w {0}; w < NUMBER_OF_WORDS; w++) {
                taken.bitmap_[w] = Atomic::exchange(bitmap_[w], static_cast<T>(0));
            }

            return taken;
        }

        /// Return the number of backing words.
        static constexpr size_t words()
        {
            return NUMBER_OF_WORDS;
        }

        /// Return the backing word with the given index.
        T word(size_t w) const
        {
            assert(w < NUMBER_OF_WORDS);
            return bitmap_[w];
        }

        /// Replace the backing word with the given index.
        void set_word(size_t w, T val)
        {
            assert(w < NUMBER_OF_WORDS);
            bitmap_[w] = val;
        }

        /// Return the index of the highest set bit or -1, if no bit is set.
        long highest() const
        {
            for (size_t w {NUMBER_OF_WORDS}; w-- > 0;) {
                if (bitmap_[w] != 0) {
                    return static_cast<long>(w * BITS_PER_WORD) + bit_scan_reverse(bitmap_[w]);
                }
            }

            return -1;
        }

        /// Return the index of the lowest set bit at or after pos or -1, if there is none.
        long next(size_t pos) const
        {
            for (; pos < NUMBER_OF_BITS; pos++) {
                T const remaining {static_cast<T>(bitmap_[word_index(pos)] & ~(bit_mask(pos) - 1))};

                if (remaining != 0) {
                    return static_cast<long>(word_index(pos) * BITS_PER_WORD) + bit_scan_forward(remaining);
                }

                pos = word_index(pos) * BITS_PER_WORD + BITS_PER_WORD - 1;
            }

            return -1;
        }

        /// Check whether no bit is set.
        bool empty() const
        {
            for (size_t w {0}; w < NUMBER_OF_WORDS; w++) {
                if (bitmap_[w] != 0) {
                    return false;
                }
            }

            return true;
        }

        bool operator==(Bitmap const &other) const
        {
            return memcmp(bitmap_, other.bitmap_, sizeof(bitmap_)) == 0;
        }

        bool operator!=(Bitmap const &other) const
        {
            return not (*this == other);
        }
};
