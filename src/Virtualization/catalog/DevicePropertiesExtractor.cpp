#include "Virtualization/catalog/DevicePropertiesExtractor.hpp"
#include "Utils/Exception.hpp"

namespace QEMUKIT {

namespace {

std::string_view trimRight(std::string_view s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

} // namespace

void DevicePropertiesExtractor::emit(std::string_view value) {
    properties.emplace_back(std::move(pendingName), std::string(value));
    pendingName.clear();
}

void DevicePropertiesExtractor::onNameSearch(char c, std::size_t index) {
    if (c == ' ' || c == '\t') return;
    if (c == ',' || c == '"') {
        throw ParseError("unexpected '" + std::string(1, c) + "' at column " + std::to_string(index + 1));
    }
    nameStart = index;
    state = State::Name;
}

void DevicePropertiesExtractor::onName(char c, std::size_t index) {
    if (c == ' ') {
        pendingName = std::string(line.substr(nameStart, index - nameStart));
        state = State::ValueStart;
    } else if (c == ',' || c == '"') {
        throw ParseError("property '" + std::string(line.substr(nameStart, index - nameStart)) + "' has no value");
    }
}

void DevicePropertiesExtractor::onValueStart(char c, std::size_t index) {
    if (c == ' ') return;
    if (c == ',') {
        throw ParseError("property '" + pendingName + "' has no value");
    }
    if (c == '"') {
        valueStart = index + 1;
        state = State::ValueInQuotes;
    } else {
        valueStart = index;
        state = State::Value;
    }
}

void DevicePropertiesExtractor::onValue(char c, std::size_t index) {
    if (c == ',') {
        emit(trimRight(line.substr(valueStart, index - valueStart)));
        state = State::NameSearch;
    }
}

void DevicePropertiesExtractor::onValueInQuotes(char c, std::size_t index) {
    if (c == '"') {
        emit(line.substr(valueStart, index - valueStart));
        state = State::PostValue;
    }
}

void DevicePropertiesExtractor::onPostValue(char c, std::size_t index) {
    if (c == ',') {
        state = State::NameSearch;
    } else if (c != ' ' && c != '\t') {
        throw ParseError("unexpected text after quoted value of '" + properties.back().first +
                         "' at column " + std::to_string(index + 1));
    }
}

void DevicePropertiesExtractor::finish() {
    switch (state) {
        case State::Name:
            throw ParseError("property '" + std::string(line.substr(nameStart)) + "' has no value");
        case State::ValueStart:
            throw ParseError("property '" + pendingName + "' has no value");
        case State::ValueInQuotes:
            throw ParseError("unterminated quoted value for '" + pendingName + "'");
        case State::Value:
            emit(trimRight(line.substr(valueStart)));
            break;
        case State::NameSearch:
        case State::PostValue:
            break;
    }
    state = State::NameSearch;
}

std::vector<DevicePropertiesExtractor::Property> DevicePropertiesExtractor::run() {
    properties.clear();
    pendingName.clear();
    state = State::NameSearch;

    for (std::size_t index = 0; index < line.size(); ++index) {
        const char c = line[index];
        switch (state) {
            case State::NameSearch:    onNameSearch(c, index); break;
            case State::Name:          onName(c, index); break;
            case State::ValueStart:    onValueStart(c, index); break;
            case State::Value:         onValue(c, index); break;
            case State::ValueInQuotes: onValueInQuotes(c, index); break;
            case State::PostValue:     onPostValue(c, index); break;
        }
    }
    finish();
    return std::move(properties);
}

} // namespace QEMUKIT
