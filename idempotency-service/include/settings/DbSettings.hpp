// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace idempotency::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Читает параметры из переменных окружения (K8s ENV).
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("IDEMPOTENCY_DB_HOST", "idempotency-postgres");
            name_ = getEnvOrDefault("IDEMPOTENCY_DB_NAME", "newsletter_db");
            user_ = getEnvOrDefault("IDEMPOTENCY_DB_USER", "newsletter_user");
            password_ = getEnvOrDefault("IDEMPOTENCY_DB_PASSWORD", "newsletter_secret_password");

            auto port = getEnvOrDefault("IDEMPOTENCY_DB_PORT", "5432");
            try
            {
                port_ = std::stoi(port);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument("IDEMPOTENCY_DB_PORT is not a number: " + port);
            }
        }

        DbSettings(std::string host, int port, std::string name, std::string user, std::string password)
            : host_(std::move(host)), port_(port), name_(std::move(name)),
              user_(std::move(user)), password_(std::move(password)) {}

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        std::string getPassword() const { return password_; }

        std::string getConnectionString() const
        {
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_;
        }

    private:
        std::string host_;
        int port_ = 5432;
        std::string name_;
        std::string user_;
        std::string password_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace idempotency::settings
