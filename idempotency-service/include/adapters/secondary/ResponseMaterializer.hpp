#pragma once

#include "domain/HttpResponse.hpp"
#include "domain/IdempotencyErrors.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace idempotency::adapters::secondary
{

    /**
     * @brief Ответ в формате строки таблицы idempotency
     *
     * headers - упорядоченный список пар (name, value), в PostgreSQL это
     * колонка header_pair[]; body - сырые байты.
     */
    struct StoredResponse
    {
        int16_t statusCode = 0;
        std::vector<domain::HeaderPair> headers;
        std::string body;
    };

    class ResponseMaterializer
    {
    public:
        /**
         * @throws domain::MalformedResponse если ответ нельзя сохранить
         */
        static StoredResponse encode(const domain::HttpResponse &response)
        {
            // статус вне 100..599 не влезает в SMALLINT-колонку без потерь
            response.ensureWellFormed();

            StoredResponse stored;
            stored.statusCode = static_cast<int16_t>(response.status);
            stored.headers = response.headers;
            stored.body = response.body;
            return stored;
        }

        /**
         * @throws domain::MalformedResponse если строка повреждена
         */
        static domain::HttpResponse decode(const StoredResponse &stored)
        {
            domain::HttpResponse response(stored.statusCode, stored.headers, stored.body);
            response.ensureWellFormed();
            return response;
        }
    };

} // namespace idempotency::adapters::secondary
