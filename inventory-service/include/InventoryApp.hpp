// include/InventoryApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/CacheSettings.hpp"
#include "settings/DbSettings.hpp"
#include "settings/InventorySettings.hpp"
#include "settings/RabbitMQSettings.hpp"

// Ports
#include "ports/input/ICostLayerService.hpp"
#include "ports/input/IInventoryQueryService.hpp"
#include "ports/input/IInventoryService.hpp"
#include "ports/input/ILowStockAlertService.hpp"
#include "ports/input/IMarginAnalyzer.hpp"
#include "ports/input/IProfitLossService.hpp"
#include "ports/input/IStockMovementLedger.hpp"
#include "ports/input/IStockRemovalService.hpp"
#include "ports/output/IEventBus.hpp"
#include "ports/output/IInventoryStore.hpp"
#include "ports/output/INotificationOutbox.hpp"
#include "ports/output/IProductCatalog.hpp"
#include "ports/output/IStockMovementRepository.hpp"
#include "ports/output/IStoreDirectory.hpp"
#include "ports/output/ITransactionSource.hpp"
#include "ports/output/IValuationEventRepository.hpp"

// Application
#include "application/CostLayerService.hpp"
#include "application/InventoryQueryService.hpp"
#include "application/InventoryService.hpp"
#include "application/LowStockAlertService.hpp"
#include "application/MarginAnalyzer.hpp"
#include "application/NotificationDispatcher.hpp"
#include "application/ProfitLossService.hpp"
#include "application/StockMovementLedger.hpp"
#include "application/StockRemovalService.hpp"
#include "application/events/SimpleDomainEventFactory.hpp"

// Secondary Adapters
#include "adapters/secondary/catalog/CachedProductCatalog.hpp"
#include "adapters/secondary/catalog/InMemoryProductCatalog.hpp"
#include "adapters/secondary/catalog/InMemoryStoreDirectory.hpp"
#include "adapters/secondary/catalog/InMemoryTransactionSource.hpp"
#include "adapters/secondary/catalog/PostgresProductCatalog.hpp"
#include "adapters/secondary/catalog/PostgresStoreDirectory.hpp"
#include "adapters/secondary/catalog/PostgresTransactionSource.hpp"
#include "adapters/secondary/events/InMemoryEventBus.hpp"
#include "adapters/secondary/events/RabbitMQEventBus.hpp"
#include "adapters/secondary/persistence/InMemoryInventoryStore.hpp"
#include "adapters/secondary/persistence/InMemoryStockMovementRepository.hpp"
#include "adapters/secondary/persistence/PostgresInventoryStore.hpp"
#include "adapters/secondary/persistence/PostgresStockMovementRepository.hpp"

// Primary Adapters
#include "adapters/primary/AdjustInventoryHandler.hpp"
#include "adapters/primary/BackfillCostLayerHandler.hpp"
#include "adapters/primary/BulkUpdateHandler.hpp"
#include "adapters/primary/CreateInventoryHandler.hpp"
#include "adapters/primary/DeleteInventoryHandler.hpp"
#include "adapters/primary/GetAlertsHandler.hpp"
#include "adapters/primary/GetLowStockItemsHandler.hpp"
#include "adapters/primary/GetCostLayersHandler.hpp"
#include "adapters/primary/GetInventoryHandler.hpp"
#include "adapters/primary/GetMarginHandler.hpp"
#include "adapters/primary/GetOrgSummaryHandler.hpp"
#include "adapters/primary/GetPriceHistoryHandler.hpp"
#include "adapters/primary/GetProductHistoryHandler.hpp"
#include "adapters/primary/GetProfitLossHandler.hpp"
#include "adapters/primary/GetStockMovementsHandler.hpp"
#include "adapters/primary/GetStoreSummaryHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/ListInventoryHandler.hpp"
#include "adapters/primary/RecordSaleHandler.hpp"
#include "adapters/primary/RemoveStockHandler.hpp"
#include "adapters/primary/ResolveAlertHandler.hpp"
#include "adapters/primary/StockCountHandler.hpp"
#include "adapters/primary/UpdateInventoryHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace inventory
{

    /**
     * @brief Inventory Service Application
     *
     * INVENTORY_STORAGE=memory|postgres выбирает хранилище,
     * EVENT_BUS=memory|rabbitmq выбирает шину уведомлений.
     * Уведомления доставляет NotificationDispatcher из outbox.
     */
    class InventoryApp : public BoostBeastApplication
    {
    public:
        InventoryApp() { std::cout << "[InventoryApp] Initializing..." << std::endl; }

        ~InventoryApp() override
        {
            if (dispatcher_)
            {
                dispatcher_->stop();
            }
            if (eventBus_)
            {
                eventBus_->stop();
            }
            std::cout << "[InventoryApp] Shutting down..." << std::endl;
        }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[InventoryApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[InventoryApp] Configuring DI..." << std::endl;

            // Шаг 1: Настройки
            auto settingsInjector = di::make_injector(
                di::bind<settings::DbSettings>().in(di::singleton),
                di::bind<settings::RabbitMQSettings>().in(di::singleton),
                di::bind<settings::CacheSettings>().in(di::singleton),
                di::bind<settings::InventorySettings>().in(di::singleton));

            auto dbSettings = settingsInjector.create<std::shared_ptr<settings::DbSettings>>();
            auto rabbitSettings = settingsInjector.create<std::shared_ptr<settings::RabbitMQSettings>>();
            auto cacheSettings = settingsInjector.create<std::shared_ptr<settings::CacheSettings>>();
            auto inventorySettings = settingsInjector.create<std::shared_ptr<settings::InventorySettings>>();

            // Шаг 2: Хранилище. Один экземпляр обслуживает три порта
            std::shared_ptr<ports::output::IInventoryStore> inventoryStore;
            std::shared_ptr<ports::output::IValuationEventRepository> valuationEvents;
            std::shared_ptr<ports::output::INotificationOutbox> outbox;
            std::shared_ptr<ports::output::IStockMovementRepository> movementRepository;
            std::shared_ptr<ports::output::IProductCatalog> productSource;
            std::shared_ptr<ports::output::IStoreDirectory> storeDirectory;
            std::shared_ptr<ports::output::ITransactionSource> transactionSource;

            if (inventorySettings->usePostgres())
            {
                std::cout << "[InventoryApp] Storage: PostgreSQL" << std::endl;
                auto store = std::make_shared<adapters::secondary::PostgresInventoryStore>(dbSettings, inventorySettings);
                inventoryStore = store;
                valuationEvents = store;
                outbox = store;
                movementRepository = std::make_shared<adapters::secondary::PostgresStockMovementRepository>(dbSettings);
                productSource = std::make_shared<adapters::secondary::PostgresProductCatalog>(dbSettings);
                storeDirectory = std::make_shared<adapters::secondary::PostgresStoreDirectory>(dbSettings);
                transactionSource = std::make_shared<adapters::secondary::PostgresTransactionSource>(dbSettings);
            }
            else
            {
                std::cout << "[InventoryApp] Storage: in-memory" << std::endl;
                auto store = std::make_shared<adapters::secondary::InMemoryInventoryStore>();
                inventoryStore = store;
                valuationEvents = store;
                outbox = store;
                movementRepository = std::make_shared<adapters::secondary::InMemoryStockMovementRepository>();
                productSource = std::make_shared<adapters::secondary::InMemoryProductCatalog>();
                storeDirectory = std::make_shared<adapters::secondary::InMemoryStoreDirectory>();
                transactionSource = std::make_shared<adapters::secondary::InMemoryTransactionSource>();
            }

            // Декоратор кеша над каталогом
            std::shared_ptr<ports::output::IProductCatalog> productCatalog =
                std::make_shared<adapters::secondary::CachedProductCatalog>(productSource, cacheSettings);

            // Шаг 3: Шина событий
            std::shared_ptr<domain::DomainEventFactory> eventFactory =
                std::make_shared<application::SimpleDomainEventFactory>();

            if (inventorySettings->useRabbitMQ())
            {
                eventBus_ = std::make_shared<adapters::secondary::RabbitMQEventBus>(rabbitSettings);
            }
            else
            {
                eventBus_ = std::make_shared<adapters::secondary::InMemoryEventBus>();
            }

            // Шаг 4: Основной injector с instance binding для адаптеров
            auto injector = di::make_injector(
                di::bind<settings::InventorySettings>().to(inventorySettings),

                di::bind<ports::output::IInventoryStore>().to(inventoryStore),
                di::bind<ports::output::IValuationEventRepository>().to(valuationEvents),
                di::bind<ports::output::INotificationOutbox>().to(outbox),
                di::bind<ports::output::IStockMovementRepository>().to(movementRepository),
                di::bind<ports::output::IProductCatalog>().to(productCatalog),
                di::bind<ports::output::IStoreDirectory>().to(storeDirectory),
                di::bind<ports::output::ITransactionSource>().to(transactionSource),
                di::bind<ports::output::IEventBus>().to(eventBus_),
                di::bind<domain::DomainEventFactory>().to(eventFactory),

                di::bind<ports::input::IStockMovementLedger>().to<application::StockMovementLedger>().in(di::singleton),
                di::bind<ports::input::IInventoryService>().to<application::InventoryService>().in(di::singleton),
                di::bind<ports::input::ICostLayerService>().to<application::CostLayerService>().in(di::singleton),
                di::bind<ports::input::IStockRemovalService>().to<application::StockRemovalService>().in(di::singleton),
                di::bind<ports::input::ILowStockAlertService>().to<application::LowStockAlertService>().in(di::singleton),
                di::bind<ports::input::IMarginAnalyzer>().to<application::MarginAnalyzer>().in(di::singleton),
                di::bind<ports::input::IProfitLossService>().to<application::ProfitLossService>().in(di::singleton),
                di::bind<ports::input::IInventoryQueryService>().to<application::InventoryQueryService>().in(di::singleton));

            // Шаг 5: HTTP Handlers
            handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();

            handlers_[getHandlerKey("GET", "/api/v1/stores/*/inventory")] =
                injector.create<std::shared_ptr<adapters::primary::ListInventoryHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/stores/*/inventory")] =
                injector.create<std::shared_ptr<adapters::primary::CreateInventoryHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/stores/*/inventory/*")] =
                injector.create<std::shared_ptr<adapters::primary::GetInventoryHandler>>();
            handlers_[getHandlerKey("PUT", "/api/v1/stores/*/inventory/*")] =
                injector.create<std::shared_ptr<adapters::primary::UpdateInventoryHandler>>();
            handlers_[getHandlerKey("DELETE", "/api/v1/stores/*/inventory/*")] =
                injector.create<std::shared_ptr<adapters::primary::DeleteInventoryHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/stores/*/inventory/*/adjust")] =
                injector.create<std::shared_ptr<adapters::primary::AdjustInventoryHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/stores/*/inventory/*/sales")] =
                injector.create<std::shared_ptr<adapters::primary::RecordSaleHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/stores/*/inventory/*/removals")] =
                injector.create<std::shared_ptr<adapters::primary::RemoveStockHandler>>();

            handlers_[getHandlerKey("GET", "/api/v1/stores/*/inventory/*/cost-layers")] =
                injector.create<std::shared_ptr<adapters::primary::GetCostLayersHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/stores/*/inventory/*/cost-layers/backfill")] =
                injector.create<std::shared_ptr<adapters::primary::BackfillCostLayerHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/stores/*/inventory/*/margin")] =
                injector.create<std::shared_ptr<adapters::primary::GetMarginHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/stores/*/inventory/*/history")] =
                injector.create<std::shared_ptr<adapters::primary::GetProductHistoryHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/stores/*/inventory/*/price-history")] =
                injector.create<std::shared_ptr<adapters::primary::GetPriceHistoryHandler>>();

            handlers_[getHandlerKey("POST", "/api/v1/stores/*/inventory-bulk")] =
                injector.create<std::shared_ptr<adapters::primary::BulkUpdateHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/stores/*/stock-counts")] =
                injector.create<std::shared_ptr<adapters::primary::StockCountHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/stores/*/stock-movements")] =
                injector.create<std::shared_ptr<adapters::primary::GetStockMovementsHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/stores/*/alerts")] =
                injector.create<std::shared_ptr<adapters::primary::GetAlertsHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/stores/*/low-stock")] =
                injector.create<std::shared_ptr<adapters::primary::GetLowStockItemsHandler>>();
            handlers_[getHandlerKey("PUT", "/api/v1/alerts/*/resolve")] =
                injector.create<std::shared_ptr<adapters::primary::ResolveAlertHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/stores/*/summary")] =
                injector.create<std::shared_ptr<adapters::primary::GetStoreSummaryHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/stores/*/profit-loss")] =
                injector.create<std::shared_ptr<adapters::primary::GetProfitLossHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/orgs/*/inventory-summary")] =
                injector.create<std::shared_ptr<adapters::primary::GetOrgSummaryHandler>>();

            // Шаг 6: Доставка уведомлений. Шина стартует первой
            std::cout << "[InventoryApp] Starting event bus (" << inventorySettings->getEventBus() << ")..." << std::endl;
            eventBus_->start();

            dispatcher_ = injector.create<std::shared_ptr<application::NotificationDispatcher>>();
            dispatcher_->start();

            std::cout << "[InventoryApp] Ready" << std::endl;
        }

    private:
        std::shared_ptr<ports::output::IEventBus> eventBus_;
        std::shared_ptr<application::NotificationDispatcher> dispatcher_;
    };

} // namespace inventory
