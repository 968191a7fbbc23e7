#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "sync/CancellationToken.hpp"
#include "sync/ItemSource.hpp"

namespace lnt::sync {

// Cursor based bulk reader over an offset-paged remote listing.
//
// Every page asks for min(remaining budget, max page size) items starting at
// the current offset and advances the offset from the response. Without
// `blocking` the sequence ends on a short page; with it the paginator sleeps
// `blocking` (interruptible by the token) and polls again, tailing forever.
// A page is short when the server returned fewer entries than requested;
// entries dropped by `readResponse` do not count. Fetch errors surface from
// next() untouched.
template <typename Req, typename Resp, typename Item>
class Paginator {
public:
    struct Page {
        std::vector<Item> items;
        std::uint64_t nextOffset{0};
        // Entries in the server response, parsed or not. Values below
        // items.size() are raised to it.
        std::size_t received{0};
    };

    using FetchPage = std::function<Resp(const Req&)>;
    using ReadResponse = std::function<Page(const Resp&)>;
    using SetRequest = std::function<void(Req&, std::uint64_t offset, std::size_t pageSize)>;

    Paginator(const CancellationToken& token,
              FetchPage fetchPage,
              ReadResponse readResponse,
              SetRequest setRequest,
              std::size_t maxPageSize,
              Req baseRequest = Req{})
        : shared_(std::make_shared<const Shared>(Shared{token,
                                                        std::move(fetchPage),
                                                        std::move(readResponse),
                                                        std::move(setRequest),
                                                        maxPageSize,
                                                        std::move(baseRequest)})) {
        if (maxPageSize == 0U) {
            throw std::invalid_argument("Paginator requires a positive page size");
        }
    }

    ItemSourcePtr<Item> request(std::optional<std::size_t> maxItems,
                                std::optional<std::chrono::milliseconds> blocking,
                                std::uint64_t startOffset) const {
        return std::make_unique<Cursor>(shared_, maxItems, blocking, startOffset);
    }

    std::size_t max_page_size() const noexcept { return shared_->maxPageSize; }

private:
    struct Shared {
        const CancellationToken& token;
        FetchPage fetchPage;
        ReadResponse readResponse;
        SetRequest setRequest;
        std::size_t maxPageSize;
        Req baseRequest;
    };

    // Cursors share the paginator state so they may outlive the paginator.
    class Cursor : public ItemSource<Item> {
    public:
        Cursor(std::shared_ptr<const Shared> owner,
               std::optional<std::size_t> maxItems,
               std::optional<std::chrono::milliseconds> blocking,
               std::uint64_t startOffset)
            : owner_(std::move(owner)), maxItems_(maxItems), blocking_(blocking), offset_(startOffset) {}

        std::optional<Item> next() override {
            for (;;) {
                if (closed_) {
                    return std::nullopt;
                }
                if (position_ < items_.size()) {
                    ++yielded_;
                    return std::move(items_[position_++]);
                }
                if (maxItems_ && yielded_ >= *maxItems_) {
                    closed_ = true;
                    continue;
                }
                if (sourceExhausted_) {
                    if (!blocking_ || owner_->token.wait(*blocking_)) {
                        closed_ = true;
                        continue;
                    }
                }
                fetch_();
            }
        }

        void close() override {
            closed_ = true;
            items_.clear();
            position_ = 0;
        }

    private:
        void fetch_() {
            std::size_t pageSize = owner_->maxPageSize;
            if (maxItems_) {
                pageSize = std::min(pageSize, *maxItems_ - yielded_);
            }

            Req request = owner_->baseRequest;
            owner_->setRequest(request, offset_, pageSize);
            const Resp response = owner_->fetchPage(request);
            Page page = owner_->readResponse(response);

            const std::size_t received = std::max(page.received, page.items.size());
            sourceExhausted_ = received < pageSize;
            if (received > 0U) {
                offset_ = page.nextOffset;
            }
            items_ = std::move(page.items);
            position_ = 0;
        }

        std::shared_ptr<const Shared> owner_;
        std::optional<std::size_t> maxItems_;
        std::optional<std::chrono::milliseconds> blocking_;
        std::uint64_t offset_;
        std::vector<Item> items_;
        std::size_t position_{0};
        std::size_t yielded_{0};
        bool sourceExhausted_{false};
        bool closed_{false};
    };

    std::shared_ptr<const Shared> shared_;
};

}  // namespace lnt::sync
