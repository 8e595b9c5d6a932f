#include "../framework/SimpleTest.hpp"
#include "playback/PlaylistCursor.hpp"

using rondo::playback::PlaylistCursor;

TEST_CASE(test_wraps_after_last_index) {
    PlaylistCursor cursor;
    ASSERT_EQ(cursor.next(3, 2), std::optional<std::size_t>(0));
}

TEST_CASE(test_starts_after_current_track) {
    PlaylistCursor cursor;
    ASSERT_EQ(*cursor.next(4, 1), 2u);
    ASSERT_TRUE(cursor.initialized());
}

TEST_CASE(test_cycles_in_order_once_initialized) {
    PlaylistCursor cursor;
    ASSERT_EQ(*cursor.next(3, 0), 1u);
    // Current index is only used to seed the cycle
    ASSERT_EQ(*cursor.next(3, 0), 2u);
    ASSERT_EQ(*cursor.next(3, 0), 0u);
    ASSERT_EQ(*cursor.next(3, 0), 1u);
}

TEST_CASE(test_without_current_starts_at_zero) {
    PlaylistCursor cursor;
    ASSERT_EQ(*cursor.next(5, std::nullopt), 0u);
    ASSERT_EQ(*cursor.next(5, std::nullopt), 1u);
}

TEST_CASE(test_empty_catalog_yields_nothing) {
    PlaylistCursor cursor;
    ASSERT_FALSE(cursor.next(0, 2).has_value());
    ASSERT_FALSE(cursor.initialized());
}

TEST_CASE(test_length_change_reseeds) {
    PlaylistCursor cursor;
    ASSERT_EQ(*cursor.next(3, 0), 1u);
    ASSERT_EQ(*cursor.next(5, 3), 4u);
    ASSERT_EQ(*cursor.next(5, 3), 0u);
}

TEST_CASE(test_invalidate_reseeds_from_current) {
    PlaylistCursor cursor;
    ASSERT_EQ(*cursor.next(4, 0), 1u);
    cursor.invalidate();
    ASSERT_FALSE(cursor.initialized());
    ASSERT_EQ(*cursor.next(4, 2), 3u);
}

TEST_CASE(test_out_of_range_current_wraps) {
    PlaylistCursor cursor;
    ASSERT_EQ(*cursor.next(3, 7), 2u);
}

TEST_CASE(test_single_entry_repeats) {
    PlaylistCursor cursor;
    ASSERT_EQ(*cursor.next(1, 0), 0u);
    ASSERT_EQ(*cursor.next(1, 0), 0u);
}

int main() {
    return rondo::test::TestRunner::instance().run_all();
}
