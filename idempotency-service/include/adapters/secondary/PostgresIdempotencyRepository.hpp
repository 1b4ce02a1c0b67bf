#pragma once

#include "ports/output/IIdempotencyRepository.hpp"
#include "adapters/secondary/ResponseMaterializer.hpp"
#include "domain/IdempotencyErrors.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <cstddef>
#include <memory>
#include <iostream>
#include <string>
#include <vector>

namespace idempotency::adapters::secondary
{

    /**
     * @brief PostgreSQL реализация хранилища сохранённых ответов
     *
     * Единственная точка сериализации - первичный ключ (owner_id, idempotency_key):
     * INSERT ... ON CONFLICT DO NOTHING либо вставляет placeholder, либо нет.
     * Соединение на каждый вызов, поэтому безопасно из нескольких потоков.
     *
     * Ошибки libpqxx (pqxx::failure) пробрасываются как domain::StorageUnavailable;
     * незакоммиченная pqxx::work откатывается в деструкторе.
     */
    class PostgresIdempotencyRepository : public idempotency::ports::output::IIdempotencyRepository
    {
    public:
        // Сколько раз повторить захват, если строка исчезла между конфликтом и чтением
        static constexpr int MAX_CLAIM_ATTEMPTS = 3;

        explicit PostgresIdempotencyRepository(std::shared_ptr<idempotency::settings::DbSettings> s) : settings_(std::move(s))
        {
            // Проверяем соединение, но не создаём таблицу (см. migrations/)
            try
            {
                pqxx::connection c(settings_->getConnectionString());
            }
            catch (const pqxx::failure &e)
            {
                std::cerr << "[PostgresIdempotencyRepository] Connection failed: " << e.what() << std::endl;
                throw domain::StorageUnavailable(std::string("Cannot connect to idempotency store: ") + e.what());
            }
            std::cout << "[PostgresIdempotencyRepository] Connected to " << settings_->getName() << std::endl;
        }

        domain::ClaimResult tryClaim(const std::string &ownerId, const domain::IdempotencyKey &key) override
        {
            return inTransaction("tryClaim", [&](pqxx::work &t)
                                 {
                for (int attempt = 0; attempt < MAX_CLAIM_ATTEMPTS; ++attempt)
                {
                    auto inserted = t.exec_params(
                        "INSERT INTO idempotency (owner_id, idempotency_key, created_at) "
                        "VALUES ($1::uuid, $2, now()) "
                        "ON CONFLICT DO NOTHING",
                        ownerId, key.value());
                    if (inserted.affected_rows() > 0)
                        return domain::ClaimResult::claimed();

                    auto r = t.exec_params(
                        "SELECT response_status_code, response_body "
                        "FROM idempotency WHERE owner_id = $1::uuid AND idempotency_key = $2",
                        ownerId, key.value());
                    if (r.empty())
                        continue; // захват освободили после нашего конфликта

                    if (r[0][0].is_null())
                        return domain::ClaimResult::inFlight();

                    return domain::ClaimResult::completed(
                        ResponseMaterializer::decode(loadStoredResponse(t, ownerId, key, r[0][0], r[0][1])));
                }
                return domain::ClaimResult::inFlight(); });
        }

        bool saveResponse(const std::string &ownerId, const domain::IdempotencyKey &key,
                          const domain::HttpResponse &response) override
        {
            auto stored = ResponseMaterializer::encode(response);
            return inTransaction("saveResponse", [&](pqxx::work &t)
                                 {
                // каждый заголовок - отдельный элемент header_pair[], порядок по ordinality
                auto r = t.exec_params(
                    "UPDATE idempotency SET "
                    "response_status_code = $3, "
                    "response_headers = ARRAY("
                    "  SELECT ROW(h.name, decode(h.value, 'hex'))::header_pair "
                    "  FROM unnest($4::text[], $5::text[]) WITH ORDINALITY AS h(name, value, ord) "
                    "  ORDER BY h.ord), "
                    "response_body = $6, created_at = now() "
                    "WHERE owner_id = $1::uuid AND idempotency_key = $2 AND response_status_code IS NULL",
                    ownerId, key.value(), stored.statusCode,
                    headerNames(stored.headers), headerValuesHex(stored.headers), toBytes(stored.body));
                return r.affected_rows() > 0; });
        }

        bool releaseClaim(const std::string &ownerId, const domain::IdempotencyKey &key) override
        {
            return inTransaction("releaseClaim", [&](pqxx::work &t)
                                 {
                auto r = t.exec_params(
                    "DELETE FROM idempotency "
                    "WHERE owner_id = $1::uuid AND idempotency_key = $2 AND response_status_code IS NULL",
                    ownerId, key.value());
                return r.affected_rows() > 0; });
        }

        std::optional<domain::IdempotencyRecord> find(const std::string &ownerId,
                                                      const domain::IdempotencyKey &key) override
        {
            return inTransaction("find", [&](pqxx::work &t) -> std::optional<domain::IdempotencyRecord>
                                 {
                auto r = t.exec_params(
                    "SELECT owner_id::text, idempotency_key, "
                    "response_status_code, response_body, "
                    "(EXTRACT(EPOCH FROM created_at) * 1000000)::bigint AS created_us "
                    "FROM idempotency WHERE owner_id = $1::uuid AND idempotency_key = $2",
                    ownerId, key.value());
                if (r.empty())
                    return std::nullopt;

                domain::IdempotencyRecord record;
                record.ownerId = r[0][0].as<std::string>();
                record.key = r[0][1].as<std::string>();
                record.createdAt = domain::Timestamp::fromEpochMicros(r[0][4].as<int64_t>());
                if (!r[0][2].is_null())
                    record.response = ResponseMaterializer::decode(loadStoredResponse(t, ownerId, key, r[0][2], r[0][3]));
                return record; });
        }

        std::size_t releaseStaleClaims(std::chrono::seconds olderThan) override
        {
            auto released = inTransaction("releaseStaleClaims", [&](pqxx::work &t)
                                          {
                auto r = t.exec_params(
                    "DELETE FROM idempotency "
                    "WHERE response_status_code IS NULL "
                    "AND created_at <= now() - ($1::bigint * interval '1 second')",
                    static_cast<int64_t>(olderThan.count()));
                return static_cast<std::size_t>(r.affected_rows()); });
            if (released > 0)
                std::cout << "[PostgresIdempotencyRepository] Released " << released << " stale claim(s)" << std::endl;
            return released;
        }

    private:
        using Bytes = std::basic_string<std::byte>;

        std::shared_ptr<idempotency::settings::DbSettings> settings_;

        template <typename Body>
        auto inTransaction(const char *operation, Body &&body)
        {
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                auto result = body(t);
                t.commit();
                return result;
            }
            catch (const pqxx::failure &e)
            {
                std::cerr << "[PostgresIdempotencyRepository] " << operation << "() failed: " << e.what() << std::endl;
                throw domain::StorageUnavailable(std::string(operation) + " failed: " + e.what());
            }
        }

        // Заголовки читаются отдельным запросом: одна строка на элемент header_pair[]
        static StoredResponse loadStoredResponse(pqxx::work &t,
                                                 const std::string &ownerId,
                                                 const domain::IdempotencyKey &key,
                                                 const pqxx::field &status,
                                                 const pqxx::field &body)
        {
            StoredResponse stored;
            stored.statusCode = status.as<int16_t>();

            auto bodyBytes = body.as<Bytes>();
            stored.body.assign(reinterpret_cast<const char *>(bodyBytes.data()), bodyBytes.size());

            auto rows = t.exec_params(
                "SELECT h.name, h.value "
                "FROM idempotency i "
                "CROSS JOIN LATERAL unnest(i.response_headers) WITH ORDINALITY AS h(name, value, ord) "
                "WHERE i.owner_id = $1::uuid AND i.idempotency_key = $2 "
                "ORDER BY h.ord",
                ownerId, key.value());

            stored.headers.reserve(rows.size());
            for (const auto &row : rows)
            {
                if (row[0].is_null() || row[1].is_null())
                    throw domain::MalformedResponse("Stored header pair has a NULL field");

                auto value = row[1].as<Bytes>();
                stored.headers.push_back({row[0].as<std::string>(),
                                          std::string(reinterpret_cast<const char *>(value.data()), value.size())});
            }
            return stored;
        }

        static std::vector<std::string> headerNames(const std::vector<domain::HeaderPair> &headers)
        {
            std::vector<std::string> names;
            names.reserve(headers.size());
            for (const auto &h : headers)
                names.push_back(h.name);
            return names;
        }

        // Значения уходят как hex-текст: text[] не несёт произвольные байты, decode() в SQL возвращает bytea
        static std::vector<std::string> headerValuesHex(const std::vector<domain::HeaderPair> &headers)
        {
            static const char digits[] = "0123456789abcdef";
            std::vector<std::string> values;
            values.reserve(headers.size());
            for (const auto &h : headers)
            {
                std::string hex;
                hex.reserve(h.value.size() * 2);
                for (unsigned char c : h.value)
                {
                    hex.push_back(digits[c >> 4]);
                    hex.push_back(digits[c & 0x0F]);
                }
                values.push_back(std::move(hex));
            }
            return values;
        }

        static Bytes toBytes(const std::string &data)
        {
            return Bytes(reinterpret_cast<const std::byte *>(data.data()), data.size());
        }
    };

} // namespace idempotency::adapters::secondary
