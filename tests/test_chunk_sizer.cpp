#include "../src/chunk_sizer.hpp"
#include <cassert>
#include <cstdint>
#include <iostream>

using namespace s3xfer;

constexpr uint64_t MiB = 1024ULL * 1024;
constexpr uint64_t GiB = 1024ULL * MiB;

void test_small_chunk_unchanged() {
    uint64_t chunksize = 7 * MiB;
    assert(find_chunksize(8 * MiB, chunksize) == chunksize);
    assert(find_chunksize(0, chunksize) == chunksize);
    std::cout << "test_small_chunk_unchanged: PASS\n";
}

void test_large_object_doubles_chunk() {
    uint64_t chunksize = 7 * MiB;
    assert(find_chunksize(8 * GiB, chunksize) == 14 * MiB);
    std::cout << "test_large_object_doubles_chunk: PASS\n";
}

void test_super_chunk_capped() {
    uint64_t chunksize = MAX_SINGLE_UPLOAD_SIZE + 1;
    uint64_t size = MAX_SINGLE_UPLOAD_SIZE * 2;
    assert(find_chunksize(size, chunksize) == MAX_SINGLE_UPLOAD_SIZE);
    std::cout << "test_super_chunk_capped: PASS\n";
}

void test_result_is_power_of_two_multiple() {
    uint64_t chunksize = 5 * MiB;
    uint64_t size = 1024 * GiB;
    uint64_t result = find_chunksize(size, chunksize);

    assert(result <= MAX_SINGLE_UPLOAD_SIZE);
    assert(result % chunksize == 0);
    uint64_t factor = result / chunksize;
    assert((factor & (factor - 1)) == 0);

    // Still covers the object within the part limit
    assert(part_count(size, result) <= MAX_PARTS);
    std::cout << "test_result_is_power_of_two_multiple: PASS\n";
}

void test_doubling_overshoot_is_capped() {
    // Needs 3 doublings (8M -> 64M) for 10 parts, but the ceiling is 32M
    uint64_t result = find_chunksize(640 * MiB, 8 * MiB, 10, 32 * MiB);
    assert(result == 32 * MiB);
    std::cout << "test_doubling_overshoot_is_capped: PASS\n";
}

void test_part_count_rounds_up() {
    assert(part_count(10, 3) == 4);
    assert(part_count(9, 3) == 3);
    assert(part_count(0, 3) == 0);
    // One byte past an exact multiple needs one more part
    assert(find_chunksize(1000 * MiB + 1, MiB) == 2 * MiB);
    assert(find_chunksize(1000 * MiB, MiB) == MiB);
    std::cout << "test_part_count_rounds_up: PASS\n";
}

int main() {
    test_small_chunk_unchanged();
    test_large_object_doubles_chunk();
    test_super_chunk_capped();
    test_result_is_power_of_two_multiple();
    test_doubling_overshoot_is_capped();
    test_part_count_rounds_up();
    std::cout << "All ChunkSizer tests passed!\n";
    return 0;
}
