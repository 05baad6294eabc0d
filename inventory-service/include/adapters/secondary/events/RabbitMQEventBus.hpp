#pragma once

#include "ports/output/IEventBus.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "domain/events/DomainEvent.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <mutex>
#include <thread>
#include <atomic>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace inventory::adapters::secondary {

/**
 * @brief RabbitMQ реализация IEventBus
 *
 * AMQP-CPP поверх Boost.Asio, event loop в отдельном потоке.
 *
 * - Exchange: из RabbitMQSettings (default: "inventory.events"), topic, durable
 * - Routing key: eventType (inventory.alert.low_stock, inventory.alert.resolved, ...)
 * - Очереди не объявляются: их привязывают потребители уведомлений
 *
 * publish() бросает, если соединение не готово: сообщение остаётся в outbox
 * и будет отправлено повторно.
 */
class RabbitMQEventBus : public ports::output::IEventBus {
public:
    explicit RabbitMQEventBus(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , running_(false)
    {
        exchangeName_ = settings_->getExchange();
        std::cout << "[RabbitMQEventBus] Created for "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " exchange=" << exchangeName_ << std::endl;
    }

    ~RabbitMQEventBus() override {
        stop();
    }

    /**
     * @throws std::runtime_error если нет соединения или канал отказал
     */
    void publish(const domain::DomainEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!running_ || !channel_ || !connection_ || !connection_->ready() || !exchangeReady_) {
            throw std::runtime_error("RabbitMQ is not connected, cannot publish " + event.eventType);
        }

        const std::string& routingKey = event.eventType;
        if (!channel_->publish(exchangeName_, routingKey, event.toJson())) {
            throw std::runtime_error("RabbitMQ channel rejected " + routingKey);
        }

        std::cout << "[RabbitMQEventBus] Published: " << routingKey << std::endl;
    }

    /**
     * @brief Подключиться к RabbitMQ и запустить event loop
     */
    void start() override {
        if (running_) return;

        std::cout << "[RabbitMQEventBus] Starting..." << std::endl;

        running_ = true;
        ioContext_ = std::make_unique<boost::asio::io_context>();

        ioThread_ = std::thread([this]() {
            try {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    handler_ = std::make_unique<AMQP::LibBoostAsioHandler>(*ioContext_);
                    connection_ = std::make_unique<AMQP::TcpConnection>(
                        handler_.get(),
                        AMQP::Address(settings_->getConnectionString())
                    );
                    channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

                    channel_->onError([this](const char* msg) {
                        std::cerr << "[RabbitMQEventBus] Channel error: " << msg << std::endl;
                        exchangeReady_ = false;
                    });

                    channel_->declareExchange(exchangeName_, AMQP::topic, AMQP::durable)
                        .onSuccess([this]() {
                            std::cout << "[RabbitMQEventBus] Exchange declared: " << exchangeName_ << std::endl;
                            exchangeReady_ = true;
                        })
                        .onError([this](const char* msg) {
                            std::cerr << "[RabbitMQEventBus] Exchange error: " << msg << std::endl;
                        });
                }

                ioContext_->run();

            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQEventBus] Connection error: " << e.what() << std::endl;
                running_ = false;
            }
        });

        std::cout << "[RabbitMQEventBus] Started" << std::endl;
    }

    void stop() override {
        if (!running_ && !ioThread_.joinable()) return;

        std::cout << "[RabbitMQEventBus] Stopping..." << std::endl;

        running_ = false;
        exchangeReady_ = false;

        if (ioContext_) {
            ioContext_->stop();
        }

        if (ioThread_.joinable()) {
            ioThread_.join();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        channel_.reset();
        connection_.reset();
        handler_.reset();
        ioContext_.reset();

        std::cout << "[RabbitMQEventBus] Stopped" << std::endl;
    }

    bool isConnected() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_ && connection_ && connection_->ready() && exchangeReady_;
    }

private:
    std::shared_ptr<settings::RabbitMQSettings> settings_;

    std::string exchangeName_;

    // AMQP-CPP
    std::unique_ptr<boost::asio::io_context> ioContext_;
    std::unique_ptr<AMQP::LibBoostAsioHandler> handler_;
    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    mutable std::mutex mutex_;

    std::atomic<bool> running_;
    std::atomic<bool> exchangeReady_{false};
    std::thread ioThread_;
};

} // namespace inventory::adapters::secondary
