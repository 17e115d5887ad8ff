#pragma once

#include "common/types.hpp"

namespace dexbook {

/// BookEntry wraps a resting Order with intrusive list links for its
/// price level. Lives only inside OrderBook's pool.
struct BookEntry {
    Order order;
    Side side;

    BookEntry* prev = nullptr;
    BookEntry* next = nullptr;
};

} // namespace dexbook
