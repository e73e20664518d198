/**
 * @file types.hpp
 * @brief Перечисления формата Lsetwatch и таблицы их кодов
 *
 * Коды перечислений фиксированы приложением Lsetwatch
 * (http://lebostein.de/lsetwatch/faq_de.html). Соответствие
 * код -> значение задаётся явной таблицей, приведение целого
 * к перечислению напрямую не используется.
 */

#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace lsetwatch::model {

/**
 * @brief Вариант шаблона набора
 */
enum class SetTemplate {
    FreeConfiguration,  ///< Свободная конфигурация
    Sealed,             ///< Запечатан
    Wishlist,           ///< Список желаний
    Sold,               ///< Продан
    GivenAway,          ///< Подарен
    Lost                ///< Утерян
};

/**
 * @brief Состояние набора
 */
enum class SetState {
    Unspecified,        ///< Не указано
    Sealed,             ///< Запечатан
    Opened,             ///< Открыт
    InConstruction,     ///< В сборке
    Assembled,          ///< Собран
    PartsAsSet,         ///< Детали, комплектом
    PartsMixed,         ///< Детали, вперемешку
    PartsForSale,       ///< Детали, на продажу
    Archived,           ///< Упакован / в архиве
    Lent,               ///< Одолжен
    Sold,               ///< Продан
    GivenAway,          ///< Подарен
    Lost                ///< Утерян
};

/**
 * @brief Состояние при покупке/продаже
 */
enum class ItemCondition {
    Unspecified,        ///< Не указано
    Sealed,             ///< Запечатан
    NewComplete,        ///< Новый, полный
    NewIncomplete,      ///< Новый, неполный
    UsedComplete,       ///< Б/у, полный
    UsedIncomplete      ///< Б/у, неполный
};

/**
 * @brief Статус инвентаризации
 */
enum class InventoryStatus {
    Unspecified,        ///< Не указано
    Complete,           ///< Полный
    Incomplete,         ///< Неполный
    WithoutMinifigs,    ///< Без минифигурок
    MinifigsOnly        ///< Только минифигурки
};

/**
 * @brief Состояние упаковки/инструкции
 */
enum class AccessoryStatus {
    NotPresent,         ///< Отсутствует
    LikeNew,            ///< Как новое
    NormalWear,         ///< Обычные следы использования
    SlightlyDamaged,    ///< Слегка повреждено
    Damaged,            ///< Повреждено
    Incomplete          ///< Неполное
};

/**
 * @brief Тип кэшбэка
 */
enum class CashbackType {
    Percent,            ///< Процент от цены покупки
    Currency,           ///< Сумма в валюте
    PaybackPoints       ///< Баллы Payback
};

/**
 * @brief Строка таблицы кодов перечисления
 */
template <typename E>
struct EnumEntry {
    int code;
    E value;
    std::string_view label;
};

/**
 * @brief Таблица кодов перечисления (специализируется для каждого типа)
 */
template <typename E>
struct EnumTraits;

template <>
struct EnumTraits<SetTemplate> {
    static constexpr std::string_view name = "SetTemplate";
    static constexpr std::array<EnumEntry<SetTemplate>, 6> entries = {{
        {0, SetTemplate::FreeConfiguration, "free configuration"},
        {1, SetTemplate::Sealed, "sealed"},
        {2, SetTemplate::Wishlist, "wishlist"},
        {3, SetTemplate::Sold, "sold"},
        {4, SetTemplate::GivenAway, "given away"},
        {5, SetTemplate::Lost, "lost"},
    }};
};

template <>
struct EnumTraits<SetState> {
    static constexpr std::string_view name = "SetState";
    static constexpr std::array<EnumEntry<SetState>, 13> entries = {{
        {0, SetState::Unspecified, "unspecified"},
        {1, SetState::Sealed, "sealed"},
        {2, SetState::Opened, "opened"},
        {3, SetState::InConstruction, "in construction"},
        {4, SetState::Assembled, "assembled"},
        {5, SetState::PartsAsSet, "parts, as set"},
        {6, SetState::PartsMixed, "parts, mixed"},
        {7, SetState::PartsForSale, "parts, for sale"},
        {8, SetState::Archived, "packed / archived"},
        {9, SetState::Lent, "lent"},
        {10, SetState::Sold, "sold"},
        {11, SetState::GivenAway, "given away"},
        {12, SetState::Lost, "lost"},
    }};
};

template <>
struct EnumTraits<ItemCondition> {
    static constexpr std::string_view name = "ItemCondition";
    static constexpr std::array<EnumEntry<ItemCondition>, 6> entries = {{
        {0, ItemCondition::Unspecified, "unspecified"},
        {1, ItemCondition::Sealed, "sealed"},
        {2, ItemCondition::NewComplete, "new, complete"},
        {3, ItemCondition::NewIncomplete, "new, incomplete"},
        {4, ItemCondition::UsedComplete, "used, complete"},
        {5, ItemCondition::UsedIncomplete, "used, incomplete"},
    }};
};

template <>
struct EnumTraits<InventoryStatus> {
    static constexpr std::string_view name = "InventoryStatus";
    static constexpr std::array<EnumEntry<InventoryStatus>, 5> entries = {{
        {0, InventoryStatus::Unspecified, "unspecified"},
        {1, InventoryStatus::Complete, "complete"},
        {2, InventoryStatus::Incomplete, "incomplete"},
        {3, InventoryStatus::WithoutMinifigs, "without minifigs"},
        {4, InventoryStatus::MinifigsOnly, "minifigs only"},
    }};
};

template <>
struct EnumTraits<AccessoryStatus> {
    static constexpr std::string_view name = "AccessoryStatus";
    static constexpr std::array<EnumEntry<AccessoryStatus>, 6> entries = {{
        {0, AccessoryStatus::NotPresent, "not present"},
        {1, AccessoryStatus::LikeNew, "present, like new"},
        {2, AccessoryStatus::NormalWear, "present, normal wear"},
        {3, AccessoryStatus::SlightlyDamaged, "present, slightly damaged"},
        {4, AccessoryStatus::Damaged, "present, damaged"},
        {5, AccessoryStatus::Incomplete, "incomplete"},
    }};
};

template <>
struct EnumTraits<CashbackType> {
    static constexpr std::string_view name = "CashbackType";
    static constexpr std::array<EnumEntry<CashbackType>, 3> entries = {{
        {0, CashbackType::Percent, "percent of purchase price"},
        {1, CashbackType::Currency, "currency amount"},
        {2, CashbackType::PaybackPoints, "payback points"},
    }};
};

/**
 * @brief Значение перечисления по коду файла
 * @return nullopt, если код не входит в закрытый набор
 */
template <typename E>
[[nodiscard]] constexpr std::optional<E> enumFromCode(long long code) noexcept {
    for (const auto& entry : EnumTraits<E>::entries) {
        if (entry.code == code) {
            return entry.value;
        }
    }
    return std::nullopt;
}

/**
 * @brief Код значения перечисления в файле
 */
template <typename E>
[[nodiscard]] constexpr int enumCode(E value) noexcept {
    for (const auto& entry : EnumTraits<E>::entries) {
        if (entry.value == value) {
            return entry.code;
        }
    }
    return -1;
}

/**
 * @brief Человекочитаемое название значения
 */
template <typename E>
[[nodiscard]] constexpr std::string_view enumLabel(E value) noexcept {
    for (const auto& entry : EnumTraits<E>::entries) {
        if (entry.value == value) {
            return entry.label;
        }
    }
    return "???";
}

} // namespace lsetwatch::model
