// idempotency-service/include/application/IdempotencyService.hpp
#pragma once

#include "ports/input/IIdempotencyService.hpp"
#include "ports/output/IIdempotencyRepository.hpp"
#include "settings/IdempotencySettings.hpp"
#include "domain/IdempotencyErrors.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>

namespace idempotency::application {

/**
 * @brief Идемпотентная обработка побочных запросов
 *
 * Поток:
 * - tryStart → хранилище атомарно вставляет placeholder (мы выполняем)
 *   или возвращает сохранённый ответ (воспроизводим)
 * - ключ занят чужим выполнением → ждём с экспоненциальной паузой
 *   до таймаута, потом DuplicateKeyInFlight
 * - операция упала → захват освобождаем, чтобы повтор мог выполнить её заново
 * - операция успешна → ответ сохраняется одной командой вместе со снятием метки
 */
class IdempotencyService : public ports::input::IIdempotencyService {
public:
    IdempotencyService(
        std::shared_ptr<ports::output::IIdempotencyRepository> repository,
        std::shared_ptr<settings::IdempotencySettings> settings
    ) : repository_(std::move(repository))
      , settings_(std::move(settings))
    {
        std::cout << "[IdempotencyService] Created (wait timeout "
                  << settings_->getWaitTimeout().count() << "ms)" << std::endl;
    }

    domain::HttpResponse execute(const std::string& ownerId,
                                 const domain::IdempotencyKey& key,
                                 const ports::input::Operation& operation) override {
        auto next = tryStart(ownerId, key);
        if (next.type == domain::NextActionType::RETURN_SAVED_RESPONSE) {
            return *next.savedResponse;
        }

        domain::HttpResponse response;
        try {
            response = operation();
        } catch (const std::exception& e) {
            std::cerr << "[IdempotencyService] Operation failed for key " << key.value()
                      << " (owner " << ownerId << "): " << e.what() << std::endl;
            releaseAfterFailure(ownerId, key);
            std::throw_with_nested(domain::EffectExecutionFailed(
                std::string("Operation failed: ") + e.what()));
        } catch (...) {
            std::cerr << "[IdempotencyService] Operation failed for key " << key.value()
                      << " (owner " << ownerId << "): unknown error" << std::endl;
            releaseAfterFailure(ownerId, key);
            std::throw_with_nested(domain::EffectExecutionFailed("Operation failed: unknown error"));
        }

        try {
            response.ensureWellFormed();
        } catch (const domain::MalformedResponse& e) {
            std::cerr << "[IdempotencyService] Rejected response for key " << key.value()
                      << ": " << e.what() << std::endl;
            releaseAfterFailure(ownerId, key);
            throw;
        }

        // StorageUnavailable здесь не освобождает захват: эффект уже случился
        return saveResponse(ownerId, key, std::move(response));
    }

    domain::NextAction tryStart(const std::string& ownerId,
                                const domain::IdempotencyKey& key) override {
        auto started = std::chrono::steady_clock::now();
        auto deadline = started + settings_->getWaitTimeout();
        auto backoff = settings_->getInitialBackoff();
        bool waiting = false;

        while (true) {
            auto claim = repository_->tryClaim(ownerId, key);

            switch (claim.status) {
                case domain::ClaimStatus::CLAIMED:
                    std::cout << "[IdempotencyService] Claimed key " << key.value()
                              << " for owner " << ownerId << std::endl;
                    return domain::NextAction::startProcessing();

                case domain::ClaimStatus::COMPLETED:
                    std::cout << "[IdempotencyService] Replaying saved response for key " << key.value()
                              << " (owner " << ownerId << ")" << std::endl;
                    return domain::NextAction::returnSavedResponse(std::move(*claim.response));

                case domain::ClaimStatus::IN_FLIGHT:
                    break;
            }

            auto now = std::chrono::steady_clock::now();
            if (settings_->isFailFast() || now >= deadline) {
                std::cerr << "[IdempotencyService] Key " << key.value() << " still in flight for owner "
                          << ownerId << ", giving up" << std::endl;
                throw domain::DuplicateKeyInFlight(ownerId, key.value());
            }

            if (!waiting) {
                std::cout << "[IdempotencyService] Key " << key.value() << " is "
                          << domain::toString(claim.status) << ", waiting for completion" << std::endl;
                waiting = true;
            }

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(backoff, std::max(remaining, std::chrono::milliseconds{1})));
            backoff = std::min(backoff * 2, settings_->getMaxBackoff());
        }
    }

    domain::HttpResponse saveResponse(const std::string& ownerId,
                                      const domain::IdempotencyKey& key,
                                      domain::HttpResponse response) override {
        response.ensureWellFormed();

        if (!repository_->saveResponse(ownerId, key, response)) {
            // захват сняли снаружи (reaper) - ничего не перезаписываем
            std::cerr << "[IdempotencyService] WARNING: claim for key " << key.value()
                      << " (owner " << ownerId << ") was gone at completion, response not saved" << std::endl;
            return response;
        }

        std::cout << "[IdempotencyService] Saved response " << response.status
                  << " for key " << key.value() << std::endl;
        return response;
    }

    void abandon(const std::string& ownerId, const domain::IdempotencyKey& key) override {
        if (repository_->releaseClaim(ownerId, key)) {
            std::cout << "[IdempotencyService] Released claim for key " << key.value()
                      << " (owner " << ownerId << ")" << std::endl;
        }
    }

    bool forceRelease(const std::string& ownerId, const domain::IdempotencyKey& key) override {
        auto released = repository_->releaseClaim(ownerId, key);
        std::cout << "[IdempotencyService] Force release of key " << key.value()
                  << " (owner " << ownerId << "): " << (released ? "released" : "nothing to release")
                  << std::endl;
        return released;
    }

    std::size_t releaseStaleClaims(std::chrono::seconds olderThan) override {
        return repository_->releaseStaleClaims(olderThan);
    }

    std::optional<domain::IdempotencyRecord> findRecord(const std::string& ownerId,
                                                        const domain::IdempotencyKey& key) override {
        return repository_->find(ownerId, key);
    }

private:
    std::shared_ptr<ports::output::IIdempotencyRepository> repository_;
    std::shared_ptr<settings::IdempotencySettings> settings_;

    // Ошибка освобождения не должна подменять исходную ошибку операции
    void releaseAfterFailure(const std::string& ownerId, const domain::IdempotencyKey& key) {
        try {
            abandon(ownerId, key);
        } catch (const domain::StorageUnavailable& e) {
            std::cerr << "[IdempotencyService] Could not release claim for key " << key.value()
                      << ", it stays in flight until reaped: " << e.what() << std::endl;
        }
    }
};

} // namespace idempotency::application
