#pragma once

#include "order_book/order.hpp"
#include <cstdint>

namespace dexbook {

/// PriceLevel: resting orders at one price, kept in ascending order_id
/// (time priority). Intrusive doubly-linked list.
struct PriceLevel {
    Price price = 0;
    Quantity total_quantity = 0;
    uint32_t order_count = 0;

    BookEntry* head = nullptr;
    BookEntry* tail = nullptr;

    /// Insert by order_id. New orders carry the highest id and go to the
    /// back in O(1); a re-inserted maker lands back in its previous slot.
    void insert(BookEntry* entry) noexcept {
        BookEntry* after = tail;
        while (after && after->order.order_id > entry->order.order_id) {
            after = after->prev;
        }
        entry->prev = after;
        entry->next = after ? after->next : head;
        if (entry->next) {
            entry->next->prev = entry;
        } else {
            tail = entry;
        }
        if (after) {
            after->next = entry;
        } else {
            head = entry;
        }
        total_quantity += entry->order.quantity;
        ++order_count;
    }

    void remove(BookEntry* entry) noexcept {
        if (entry->prev) {
            entry->prev->next = entry->next;
        } else {
            head = entry->next;
        }
        if (entry->next) {
            entry->next->prev = entry->prev;
        } else {
            tail = entry->prev;
        }
        entry->prev = nullptr;
        entry->next = nullptr;
        total_quantity -= entry->order.quantity;
        --order_count;
    }

    BookEntry* front() const noexcept { return head; }

    bool empty() const noexcept { return head == nullptr; }
};

} // namespace dexbook
