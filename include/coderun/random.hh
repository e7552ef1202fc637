#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <random>

// Fills @p bytes bytes of @p dest with random values obtained from getrandom(2)
void fill_randomly(void* dest, size_t bytes);

class RandomDevice {
public:
    using result_type = uint64_t;

    constexpr static result_type min() noexcept {
        return std::numeric_limits<result_type>::min();
    }

    constexpr static result_type max() noexcept {
        return std::numeric_limits<result_type>::max();
    }

private:
    std::array<result_type, 256 / sizeof(result_type)> buff{};
    size_t pos = buff.size();

    void fill_buff() {
        fill_randomly(buff.data(), buff.size() * sizeof(result_type));
        pos = 0;
    }

public:
    RandomDevice() { fill_buff(); }

    RandomDevice(const RandomDevice&) = delete;
    RandomDevice(RandomDevice&&) noexcept = default;
    RandomDevice& operator=(const RandomDevice&) = delete;
    RandomDevice& operator=(RandomDevice&&) noexcept = default;

    ~RandomDevice() = default;

    result_type operator()() {
        if (pos == buff.size()) {
            fill_buff();
        }
        return buff[pos++];
    }
};

inline RandomDevice& get_random_generator() {
    static thread_local RandomDevice random_generator;
    return random_generator;
}

// Get random from [a, b]
template <class T>
T get_random(T a, T b) {
    return std::uniform_int_distribution<T>(a, b)(get_random_generator());
}
