#pragma once

#include "ports/output/IInventoryStore.hpp"
#include "ports/output/IInventoryUnitOfWork.hpp"
#include "ports/output/INotificationOutbox.hpp"
#include "ports/output/IValuationEventRepository.hpp"
#include "domain/FifoCostCalculator.hpp"
#include "domain/errors/InventoryErrors.hpp"
#include "utils/UuidGenerator.hpp"
#include <KeyedLockTable.hpp>
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <deque>
#include <iostream>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace inventory::adapters::secondary {

/**
 * @brief In-memory хранилище остатков, слоёв, алертов, журналов стоимости и outbox
 *
 * Сериализация по ключу через KeyedLockTable: единица работы держит ключ
 * всё время жизни. Единица работы меняет копию состояния ключа и при
 * commit() подменяет её целиком под коротким эксклюзивным замком,
 * поэтому читатели не видят промежуточных состояний.
 */
class InMemoryInventoryStore : public ports::output::IInventoryStore,
                               public ports::output::IValuationEventRepository,
                               public ports::output::INotificationOutbox {
public:
    InMemoryInventoryStore() {
        std::cout << "[InMemoryInventoryStore] Created" << std::endl;
    }

    // ============================================
    // IInventoryStore
    // ============================================

    std::unique_ptr<ports::output::IInventoryUnitOfWork> begin(
        const domain::StockKey& key,
        std::chrono::milliseconds timeout) override
    {
        auto guard = locks_.tryLockFor(key.toString(), timeout);
        if (!guard) {
            throw domain::RetryableStorageError(
                "Timed out after " + std::to_string(timeout.count())
                + "ms waiting for inventory key " + key.toString());
        }

        KeyState snapshot;
        {
            std::shared_lock<std::shared_mutex> lock(dataMutex_);
            auto it = keys_.find(key);
            if (it != keys_.end()) {
                snapshot = it->second;
            }
        }

        return std::make_unique<UnitOfWork>(*this, key, std::move(guard), std::move(snapshot));
    }

    std::optional<domain::InventoryRecord> findRecord(const domain::StockKey& key) override {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);
        auto it = keys_.find(key);
        return it != keys_.end() ? it->second.record : std::nullopt;
    }

    std::vector<domain::InventoryRecord> findRecordsByStore(const std::string& storeId) override {
        std::vector<domain::InventoryRecord> result;
        {
            std::shared_lock<std::shared_mutex> lock(dataMutex_);
            for (const auto& [key, state] : keys_) {
                if (key.storeId == storeId && state.record) {
                    result.push_back(*state.record);
                }
            }
        }

        std::sort(result.begin(), result.end(),
            [](const domain::InventoryRecord& a, const domain::InventoryRecord& b) {
                return a.productId < b.productId;
            });
        return result;
    }

    std::vector<domain::CostLayer> findLayers(const domain::StockKey& key) override {
        std::vector<domain::CostLayer> layers;
        {
            std::shared_lock<std::shared_mutex> lock(dataMutex_);
            auto it = keys_.find(key);
            if (it != keys_.end()) {
                layers = it->second.layers;
            }
        }
        domain::FifoCostCalculator::sortFifo(layers);
        return layers;
    }

    std::optional<domain::LowStockAlert> findActiveAlert(const domain::StockKey& key) override {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);
        auto it = keys_.find(key);
        if (it == keys_.end()) {
            return std::nullopt;
        }
        return activeOf(it->second.alerts);
    }

    std::vector<domain::LowStockAlert> findActiveAlertsByStore(const std::string& storeId) override {
        std::vector<domain::LowStockAlert> result;
        {
            std::shared_lock<std::shared_mutex> lock(dataMutex_);
            for (const auto& [key, state] : keys_) {
                if (key.storeId != storeId) {
                    continue;
                }
                if (auto active = activeOf(state.alerts)) {
                    result.push_back(*active);
                }
            }
        }

        // Новые первые
        std::sort(result.begin(), result.end(),
            [](const domain::LowStockAlert& a, const domain::LowStockAlert& b) {
                return a.createdAt > b.createdAt;
            });
        return result;
    }

    std::optional<domain::LowStockAlert> findAlertById(const std::string& alertId) override {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);
        for (const auto& [key, state] : keys_) {
            for (const auto& alert : state.alerts) {
                if (alert.id == alertId) {
                    return alert;
                }
            }
        }
        return std::nullopt;
    }

    // ============================================
    // IValuationEventRepository
    // ============================================

    std::vector<domain::PriceChangeEvent> findPriceChanges(
        const std::string& storeId,
        const std::optional<std::string>& productId,
        const std::optional<domain::Timestamp>& from,
        const std::optional<domain::Timestamp>& to) override
    {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);
        std::vector<domain::PriceChangeEvent> result;
        std::copy_if(priceChanges_.begin(), priceChanges_.end(), std::back_inserter(result),
            [&](const domain::PriceChangeEvent& e) {
                return e.storeId == storeId
                    && (!productId || e.productId == *productId)
                    && inWindow(e.occurredAt, from, to);
            });
        std::stable_sort(result.begin(), result.end(),
            [](const auto& a, const auto& b) { return a.occurredAt < b.occurredAt; });
        return result;
    }

    std::vector<domain::InventoryRevaluationEvent> findRevaluations(
        const std::string& storeId,
        const std::optional<std::string>& productId,
        const std::optional<domain::Timestamp>& from,
        const std::optional<domain::Timestamp>& to) override
    {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);
        std::vector<domain::InventoryRevaluationEvent> result;
        std::copy_if(revaluations_.begin(), revaluations_.end(), std::back_inserter(result),
            [&](const domain::InventoryRevaluationEvent& e) {
                return e.storeId == storeId
                    && (!productId || e.productId == *productId)
                    && inWindow(e.occurredAt, from, to);
            });
        std::stable_sort(result.begin(), result.end(),
            [](const auto& a, const auto& b) { return a.occurredAt < b.occurredAt; });
        return result;
    }

    // ============================================
    // INotificationOutbox
    // ============================================

    std::vector<domain::OutboxMessage> fetchPending(size_t limit) override {
        std::lock_guard<std::mutex> lock(outboxMutex_);
        size_t count = std::min(limit, pending_.size());
        return std::vector<domain::OutboxMessage>(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(count));
    }

    void markDelivered(const std::string& messageId) override {
        std::lock_guard<std::mutex> lock(outboxMutex_);
        auto it = findPending(messageId);
        if (it != pending_.end()) {
            pending_.erase(it);
            ++deliveredCount_;
        }
    }

    bool markFailed(const std::string& messageId,
                    const std::string& error,
                    int maxAttempts) override
    {
        std::lock_guard<std::mutex> lock(outboxMutex_);
        auto it = findPending(messageId);
        if (it == pending_.end()) {
            return false;
        }

        it->attempts++;
        it->lastError = error;
        if (it->attempts < maxAttempts) {
            return false;
        }

        deadLetters_.push_back(std::move(*it));
        if (deadLetters_.size() > DEAD_LETTER_LIMIT) {
            deadLetters_.pop_front();
        }
        pending_.erase(it);
        return true;
    }

    size_t pendingCount() override {
        std::lock_guard<std::mutex> lock(outboxMutex_);
        return pending_.size();
    }

    /**
     * @brief Сколько сообщений доставлено с момента запуска
     */
    size_t deliveredCount() const {
        std::lock_guard<std::mutex> lock(outboxMutex_);
        return deliveredCount_;
    }

    /**
     * @brief Сообщения, ждущие доставки, в порядке поступления
     */
    std::vector<domain::OutboxMessage> pendingMessages() const {
        std::lock_guard<std::mutex> lock(outboxMutex_);
        return std::vector<domain::OutboxMessage>(pending_.begin(), pending_.end());
    }

    /**
     * @brief Последние сброшенные после maxAttempts сообщения (не больше DEAD_LETTER_LIMIT)
     */
    std::vector<domain::OutboxMessage> deadLetters() const {
        std::lock_guard<std::mutex> lock(outboxMutex_);
        return std::vector<domain::OutboxMessage>(deadLetters_.begin(), deadLetters_.end());
    }

    /**
     * @brief Все алерты ключа, включая закрытые
     */
    std::vector<domain::LowStockAlert> alertHistory(const domain::StockKey& key) const {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);
        auto it = keys_.find(key);
        return it != keys_.end() ? it->second.alerts : std::vector<domain::LowStockAlert>{};
    }

    bool isKeyLocked(const domain::StockKey& key) const {
        return locks_.isLocked(key.toString());
    }

private:
    struct KeyState {
        std::optional<domain::InventoryRecord> record;
        std::vector<domain::CostLayer> layers;
        std::vector<domain::LowStockAlert> alerts;
    };

    static constexpr size_t DEAD_LETTER_LIMIT = 100;

    /**
     * @brief Единица работы над одним ключом
     */
    class UnitOfWork : public ports::output::IInventoryUnitOfWork {
    public:
        UnitOfWork(InMemoryInventoryStore& store,
                   domain::StockKey key,
                   KeyedLockTable<std::string>::Guard guard,
                   KeyState snapshot)
            : store_(store)
            , key_(std::move(key))
            , guard_(std::move(guard))
            , state_(std::move(snapshot))
        {}

        const domain::StockKey& key() const override { return key_; }

        std::optional<domain::InventoryRecord> record() override {
            ensureOpen();
            return state_.record;
        }

        void saveRecord(const domain::InventoryRecord& record) override {
            ensureOpen();
            state_.record = record;
        }

        void deleteRecord() override {
            ensureOpen();
            state_.record.reset();
        }

        std::vector<domain::CostLayer> layers() override {
            ensureOpen();
            auto layers = state_.layers;
            domain::FifoCostCalculator::sortFifo(layers);
            return layers;
        }

        domain::CostLayer insertLayer(const domain::CostLayer& layer) override {
            ensureOpen();
            domain::CostLayer stored = layer;
            stored.sequence = ++store_.layerSequence_;
            state_.layers.push_back(stored);
            return stored;
        }

        void updateLayerQuantity(const std::string& layerId, int64_t quantityRemaining) override {
            ensureOpen();
            for (auto& layer : state_.layers) {
                if (layer.id == layerId) {
                    layer.quantityRemaining = quantityRemaining;
                    return;
                }
            }
        }

        void deleteLayer(const std::string& layerId) override {
            ensureOpen();
            state_.layers.erase(
                std::remove_if(state_.layers.begin(), state_.layers.end(),
                    [&layerId](const domain::CostLayer& l) { return l.id == layerId; }),
                state_.layers.end());
        }

        std::optional<domain::LowStockAlert> activeAlert() override {
            ensureOpen();
            return activeOf(state_.alerts);
        }

        void saveAlert(const domain::LowStockAlert& alert) override {
            ensureOpen();
            for (auto& existing : state_.alerts) {
                if (existing.id == alert.id) {
                    existing = alert;
                    return;
                }
            }
            state_.alerts.push_back(alert);
        }

        void appendPriceChange(const domain::PriceChangeEvent& event) override {
            ensureOpen();
            priceChanges_.push_back(event);
        }

        void appendRevaluation(const domain::InventoryRevaluationEvent& event) override {
            ensureOpen();
            revaluations_.push_back(event);
        }

        void enqueueNotification(const domain::DomainEvent& event) override {
            ensureOpen();
            domain::OutboxMessage message;
            message.id = utils::UuidGenerator::generate();
            message.eventType = event.eventType;
            message.payload = event.toJson();
            message.storeId = key_.storeId;
            message.productId = key_.productId;
            message.createdAt = domain::Timestamp::now();
            outbox_.push_back(std::move(message));
        }

        void commit() override {
            ensureOpen();
            {
                std::unique_lock<std::shared_mutex> lock(store_.dataMutex_);
                if (!state_.record && state_.layers.empty() && state_.alerts.empty()) {
                    store_.keys_.erase(key_);
                } else {
                    store_.keys_[key_] = state_;
                }
                store_.priceChanges_.insert(store_.priceChanges_.end(),
                                            priceChanges_.begin(), priceChanges_.end());
                store_.revaluations_.insert(store_.revaluations_.end(),
                                            revaluations_.begin(), revaluations_.end());
            }
            {
                std::lock_guard<std::mutex> lock(store_.outboxMutex_);
                for (auto& message : outbox_) {
                    store_.pending_.push_back(std::move(message));
                }
            }
            finished_ = true;
        }

        void rollback() override {
            finished_ = true;
        }

    private:
        void ensureOpen() const {
            if (finished_) {
                throw std::logic_error("Unit of work for " + key_.toString() + " is already finished");
            }
        }

        InMemoryInventoryStore& store_;
        domain::StockKey key_;
        KeyedLockTable<std::string>::Guard guard_;
        KeyState state_;
        std::vector<domain::PriceChangeEvent> priceChanges_;
        std::vector<domain::InventoryRevaluationEvent> revaluations_;
        std::vector<domain::OutboxMessage> outbox_;
        bool finished_ = false;
    };

    static std::optional<domain::LowStockAlert> activeOf(const std::vector<domain::LowStockAlert>& alerts) {
        for (const auto& alert : alerts) {
            if (!alert.isResolved) {
                return alert;
            }
        }
        return std::nullopt;
    }

    static bool inWindow(const domain::Timestamp& at,
                         const std::optional<domain::Timestamp>& from,
                         const std::optional<domain::Timestamp>& to) {
        return (!from || at >= *from) && (!to || at < *to);
    }

    std::deque<domain::OutboxMessage>::iterator findPending(const std::string& messageId) {
        return std::find_if(pending_.begin(), pending_.end(),
            [&messageId](const domain::OutboxMessage& m) { return m.id == messageId; });
    }

    KeyedLockTable<std::string> locks_;

    mutable std::shared_mutex dataMutex_;
    std::unordered_map<domain::StockKey, KeyState> keys_;
    std::vector<domain::PriceChangeEvent> priceChanges_;
    std::vector<domain::InventoryRevaluationEvent> revaluations_;
    std::atomic<int64_t> layerSequence_{0};

    // Доставленные и сброшенные сообщения из очереди удаляются
    mutable std::mutex outboxMutex_;
    std::deque<domain::OutboxMessage> pending_;
    std::deque<domain::OutboxMessage> deadLetters_;
    size_t deliveredCount_ = 0;
};

} // namespace inventory::adapters::secondary
