//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#include <new>

#include "heap.hpp"

std::string kcore::heap::content() const {
    std::stringstream ss;
    ss << "total:" << total_bytes()
       << ", used:" << used_
       << ", blocks:" << free_block_count();
    return ss.str();
}

void kcore::heap::init(void* start, std::size_t size) {
    KCORE_MED_METHOD_ENTER("init", start, size);
    const std::size_t block = config::heap::block_size();
    std::uintptr_t s = reinterpret_cast<std::uintptr_t>(start);
    std::uintptr_t b = align_up(s, block);
    std::uintptr_t e = align_down(s + size, block);

    used_ = 0;
    head_ = nullptr;

    if(!start || e <= b || e - b < block) [[unlikely]] {
        begin_ = 0;
        end_ = 0;
        return;
    }

    begin_ = b;
    end_ = e;
    head_ = new(reinterpret_cast<void*>(b)) free_block{ e - b, nullptr };
}

void* kcore::heap::allocate(std::size_t size, std::size_t align) {
    KCORE_LOW_METHOD_ENTER("allocate", size, align);
    const std::size_t block = config::heap::block_size();
    size = heap::rounded(size);

    // block aligned addresses satisfy every smaller alignment
    if(align < block) { align = block; }

    free_block* prev = nullptr;

    for(free_block* cur = head_; cur; prev = cur, cur = cur->next) {
        std::uintptr_t b = reinterpret_cast<std::uintptr_t>(cur);
        std::uintptr_t e = b + cur->size;
        std::uintptr_t s = align_up(b, align);

        if(s >= e || e - s < size) { continue; }

        std::size_t front = s - b;
        std::size_t back = e - (s + size);
        free_block* next = cur->next;

        if(back) {
            next = new(reinterpret_cast<void*>(s + size)) free_block{ back, next };
        }

        if(front) {
            // the aligned-away prefix stays in place as a smaller block
            cur->size = front;
            cur->next = next;
        } else if(prev) {
            prev->next = next;
        } else {
            head_ = next;
        }

        used_ += size;
        KCORE_MIN_METHOD_BODY("allocate", "allocated ", size, " at ", (void*)s);
        return reinterpret_cast<void*>(s);
    }

    KCORE_LOW_METHOD_BODY("allocate", "no fit for ", size);
    return nullptr;
}

void kcore::heap::deallocate(void* ptr, std::size_t size) {
    KCORE_LOW_METHOD_ENTER("deallocate", ptr, size);
    size = heap::rounded(size);
    std::uintptr_t b = reinterpret_cast<std::uintptr_t>(ptr);
    std::uintptr_t e = b + size;

    free_block* prev = nullptr;
    free_block* next = head_;

    while(next && reinterpret_cast<std::uintptr_t>(next) < b) {
        prev = next;
        next = next->next;
    }

    std::uintptr_t prev_end = prev
        ? reinterpret_cast<std::uintptr_t>(prev) + prev->size
        : begin_;

    if(b < prev_end || (next && e > reinterpret_cast<std::uintptr_t>(next)) || e > end_) [[unlikely]] {
        KCORE_ERROR_METHOD_BODY("deallocate", ptr, " overlaps free memory");
        throw invalid_free(ptr, size);
    }

    free_block* blk = new(ptr) free_block{ size, next };

    // merge with the following block
    if(next && e == reinterpret_cast<std::uintptr_t>(next)) {
        blk->size += next->size;
        blk->next = next->next;
    }

    // merge with the preceding block
    if(prev && prev_end == b) {
        prev->size += blk->size;
        prev->next = blk->next;
    } else if(prev) {
        prev->next = blk;
    } else {
        head_ = blk;
    }

    used_ -= size;
}

std::size_t kcore::heap::largest_free_block() const {
    std::size_t largest = 0;

    for(free_block* cur = head_; cur; cur = cur->next) {
        if(cur->size > largest) { largest = cur->size; }
    }

    return largest;
}

std::size_t kcore::heap::free_block_count() const {
    std::size_t count = 0;
    for(free_block* cur = head_; cur; cur = cur->next) { ++count; }
    return count;
}
