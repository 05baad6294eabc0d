// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>

namespace inventory::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Читает из ENV:
     * - INVENTORY_DB_HOST (default: "inventory-postgres")
     * - INVENTORY_DB_PORT (default: 5432)
     * - INVENTORY_DB_NAME (default: "inventory_db")
     * - INVENTORY_DB_USER (default: "inventory_user")
     * - INVENTORY_DB_PASSWORD
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("INVENTORY_DB_HOST", "inventory-postgres");
            port_ = std::stoi(getEnvOrDefault("INVENTORY_DB_PORT", "5432"));
            name_ = getEnvOrDefault("INVENTORY_DB_NAME", "inventory_db");
            user_ = getEnvOrDefault("INVENTORY_DB_USER", "inventory_user");
            password_ = getEnvOrDefault("INVENTORY_DB_PASSWORD", "inventory_secret_password");
            connectTimeoutSeconds_ = std::stoi(getEnvOrDefault("INVENTORY_DB_CONNECT_TIMEOUT_SECONDS", "5"));
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        std::string getPassword() const { return password_; }

        /**
         * @brief Строка подключения libpqxx
         */
        std::string getConnectionString() const
        {
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_ +
                   " connect_timeout=" + std::to_string(connectTimeoutSeconds_);
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
        int connectTimeoutSeconds_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace inventory::settings
