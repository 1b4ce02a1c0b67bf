// include/ReaperApp.hpp
#pragma once

#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/IdempotencySettings.hpp"

// Ports
#include "ports/input/IIdempotencyService.hpp"
#include "ports/output/IIdempotencyRepository.hpp"

// Application
#include "application/IdempotencyService.hpp"
#include "application/StaleClaimReaper.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresIdempotencyRepository.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace di = boost::di;

namespace idempotency
{

    /**
     * @brief Процесс очистки брошенных захватов ключей идемпотентности
     *
     * HTTP-слой встраивает IdempotencyService в свои обработчики сам;
     * этот процесс только снимает зависшие placeholder-строки.
     *
     * Аргументы: --once - один проход и выход (для cron).
     */
    class ReaperApp
    {
    public:
        ReaperApp() { std::cout << "[ReaperApp] Initializing..." << std::endl; }
        ~ReaperApp() { std::cout << "[ReaperApp] Shutting down..." << std::endl; }

        // Template Method: loadEnvironment → configureInjection → start
        void run(int argc, char *argv[])
        {
            loadEnvironment(argc, argv);
            configureInjection();
            start();
        }

        void stop()
        {
            stopRequested_ = true;
        }

    protected:
        void loadEnvironment(int argc, char *argv[])
        {
            for (int i = 1; i < argc; ++i)
            {
                std::string arg = argv[i];
                if (arg == "--once")
                {
                    once_ = true;
                }
                else
                {
                    std::cerr << "[ReaperApp] Unknown argument ignored: " << arg << std::endl;
                }
            }

            dbSettings_ = std::make_shared<settings::DbSettings>();
            idempotencySettings_ = std::make_shared<settings::IdempotencySettings>();
            std::cout << "[ReaperApp] Environment loaded (db " << dbSettings_->getHost() << ":"
                      << dbSettings_->getPort() << "/" << dbSettings_->getName() << ")" << std::endl;
        }

        void configureInjection()
        {
            std::cout << "[ReaperApp] Configuring DI..." << std::endl;

            auto injector = di::make_injector(
                di::bind<settings::DbSettings>().to(dbSettings_),
                di::bind<settings::IdempotencySettings>().to(idempotencySettings_),

                di::bind<ports::output::IIdempotencyRepository>()
                    .to<adapters::secondary::PostgresIdempotencyRepository>()
                    .in(di::singleton),

                di::bind<ports::input::IIdempotencyService>()
                    .to<application::IdempotencyService>()
                    .in(di::singleton));

            reaper_ = injector.create<std::shared_ptr<application::StaleClaimReaper>>();
        }

        void start()
        {
            if (!reaper_->isEnabled())
            {
                std::cout << "[ReaperApp] IDEMPOTENCY_STALE_CLAIM_TTL_SECONDS is 0, nothing to do" << std::endl;
                return;
            }

            if (once_)
            {
                auto released = reaper_->runOnce();
                std::cout << "[ReaperApp] Single sweep released " << released << " claim(s)" << std::endl;
                return;
            }

            reaper_->start();
            while (!stopRequested_)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            reaper_->stop();
            std::cout << "[ReaperApp] Released " << reaper_->releasedTotal() << " claim(s) in "
                      << reaper_->sweepCount() << " sweep(s)" << std::endl;
        }

    private:
        std::shared_ptr<settings::DbSettings> dbSettings_;
        std::shared_ptr<settings::IdempotencySettings> idempotencySettings_;
        std::shared_ptr<application::StaleClaimReaper> reaper_;
        std::atomic<bool> stopRequested_{false};
        bool once_ = false;
    };

} // namespace idempotency
