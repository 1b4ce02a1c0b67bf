#pragma once

#include "ports/output/IIdempotencyRepository.hpp"
#include "adapters/secondary/ResponseMaterializer.hpp"
#include <ThreadSafeMap.hpp>
#include <functional>
#include <iostream>
#include <optional>

namespace idempotency::adapters::secondary {

/**
 * @brief In-memory реализация хранилища сохранённых ответов
 *
 * Для тестов и однопроцессного встраивания: взаимное исключение
 * обеспечивается только внутри процесса. Строки хранятся в том же
 * виде, что и в PostgreSQL (через ResponseMaterializer).
 */
class InMemoryIdempotencyRepository : public ports::output::IIdempotencyRepository {
public:
    domain::ClaimResult tryClaim(const std::string& ownerId,
                                 const domain::IdempotencyKey& key) override {
        auto placeholder = std::make_shared<Row>();
        placeholder->createdAt = domain::Timestamp::now();

        auto [inserted, current] = rows_.findOrInsert(RowKey{ownerId, key.value()}, placeholder);
        if (inserted) {
            return domain::ClaimResult::claimed();
        }
        if (!current->response) {
            return domain::ClaimResult::inFlight();
        }
        return domain::ClaimResult::completed(ResponseMaterializer::decode(*current->response));
    }

    bool saveResponse(const std::string& ownerId,
                      const domain::IdempotencyKey& key,
                      const domain::HttpResponse& response) override {
        auto completed = std::make_shared<Row>();
        completed->response = ResponseMaterializer::encode(response);
        completed->createdAt = domain::Timestamp::now();

        return rows_.replaceIf(RowKey{ownerId, key.value()}, isIncomplete, completed);
    }

    bool releaseClaim(const std::string& ownerId, const domain::IdempotencyKey& key) override {
        return rows_.eraseIf(RowKey{ownerId, key.value()}, isIncomplete);
    }

    std::optional<domain::IdempotencyRecord> find(const std::string& ownerId,
                                                  const domain::IdempotencyKey& key) override {
        auto row = rows_.find(RowKey{ownerId, key.value()});
        if (!row) {
            return std::nullopt;
        }

        domain::IdempotencyRecord record;
        record.ownerId = ownerId;
        record.key = key.value();
        record.createdAt = row->createdAt;
        if (row->response) {
            record.response = ResponseMaterializer::decode(*row->response);
        }
        return record;
    }

    std::size_t releaseStaleClaims(std::chrono::seconds olderThan) override {
        auto now = domain::Timestamp::now();
        auto released = rows_.eraseWhere([&](const Row& row) {
            return isIncomplete(row) && now.value - row.createdAt.value >= olderThan;
        });
        if (released > 0) {
            std::cout << "[InMemoryIdempotencyRepository] Released " << released << " stale claim(s)" << std::endl;
        }
        return released;
    }

    std::size_t size() const { return rows_.size(); }

private:
    struct Row {
        std::optional<StoredResponse> response;
        domain::Timestamp createdAt;
    };

    struct RowKey {
        std::string ownerId;
        std::string key;

        bool operator==(const RowKey& other) const {
            return ownerId == other.ownerId && key == other.key;
        }
    };

    struct RowKeyHash {
        std::size_t operator()(const RowKey& k) const {
            auto h1 = std::hash<std::string>{}(k.ownerId);
            auto h2 = std::hash<std::string>{}(k.key);
            return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
        }
    };

    static bool isIncomplete(const Row& row) { return !row.response.has_value(); }

    ThreadSafeMap<RowKey, Row, RowKeyHash> rows_;
};

} // namespace idempotency::adapters::secondary
