/**
 * @file format_config.cpp
 * @brief Загрузка и сохранение параметров формата в JSON
 */

#include "format_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace lsetwatch::io {

using json = nlohmann::json;

namespace {

FormatOptions formatOptionsFromObject(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Параметры формата должны быть JSON-объектом");
    }

    FormatOptions options;
    options.locale = j.value("locale", std::string{});
    options.date_format = j.value("date_format", std::string(kDefaultDateFormat));

    if (j.contains("decimal_separator") && !j["decimal_separator"].is_null()) {
        auto sep = j["decimal_separator"].get<std::string>();
        if (sep.size() != 1) {
            throw ConfigError("decimal_separator должен быть одним символом: \"" + sep + "\"");
        }
        options.decimal_separator = sep.front();
    }

    return options;
}

json formatOptionsToObject(const FormatOptions& options) {
    json j;
    j["locale"] = options.locale;
    j["decimal_separator"] = options.decimal_separator.has_value()
        ? json(std::string(1, *options.decimal_separator))
        : json(nullptr);
    j["date_format"] = options.date_format;
    return j;
}

json loadJson(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Не удалось открыть файл параметров: " + path.string());
    }

    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("Ошибка парсинга JSON: " + std::string(e.what()));
    }
}

} // anonymous namespace

FormatOptions formatOptionsFromJson(const std::string& json_str) {
    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw ConfigError("Ошибка парсинга JSON: " + std::string(e.what()));
    }

    try {
        return formatOptionsFromObject(j);
    } catch (const json::type_error& e) {
        throw ConfigError("Неверный тип значения: " + std::string(e.what()));
    }
}

std::string formatOptionsToJson(const FormatOptions& options, int indent) {
    return formatOptionsToObject(options).dump(indent);
}

ReadOptions loadReadOptions(const std::filesystem::path& path) {
    auto j = loadJson(path);

    try {
        ReadOptions options;
        options.format = formatOptionsFromObject(j);
        if (j.contains("has_header") && !j["has_header"].is_null()) {
            options.has_header = j["has_header"].get<bool>();
        }
        return options;
    } catch (const json::type_error& e) {
        throw ConfigError("Неверный тип значения: " + std::string(e.what()));
    }
}

WriteOptions loadWriteOptions(const std::filesystem::path& path) {
    auto j = loadJson(path);

    try {
        WriteOptions options;
        options.format = formatOptionsFromObject(j);
        options.include_header = j.value("include_header", true);
        return options;
    } catch (const json::type_error& e) {
        throw ConfigError("Неверный тип значения: " + std::string(e.what()));
    }
}

void saveFormatOptions(const FormatOptions& options, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw ConfigError("Не удалось создать файл: " + path.string());
    }

    file << formatOptionsToJson(options) << '\n';
    if (!file) {
        throw ConfigError("Ошибка записи файла: " + path.string());
    }
}

} // namespace lsetwatch::io
