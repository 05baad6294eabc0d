#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Тип операции в журнале движения остатков
 */
enum class MovementAction {
    CREATE,      ///< Первичное заведение остатка
    UPDATE,      ///< Правка записи (количество, пороги, себестоимость)
    ADJUSTMENT,  ///< Относительное изменение (+n / -n), продажи, возвраты
    REMOVAL,     ///< Списание (порча, истечение срока, кража...)
    DELETE       ///< Удаление записи
};

inline std::string toString(MovementAction action) {
    switch (action) {
        case MovementAction::CREATE:     return "create";
        case MovementAction::UPDATE:     return "update";
        case MovementAction::ADJUSTMENT: return "adjustment";
        case MovementAction::REMOVAL:    return "removal";
        case MovementAction::DELETE:     return "delete";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline MovementAction movementActionFromString(const std::string& str) {
    if (str == "create")     return MovementAction::CREATE;
    if (str == "update")     return MovementAction::UPDATE;
    if (str == "adjustment") return MovementAction::ADJUSTMENT;
    if (str == "removal")    return MovementAction::REMOVAL;
    if (str == "delete")     return MovementAction::DELETE;
    throw std::invalid_argument("Unknown MovementAction: " + str);
}

} // namespace inventory::domain
