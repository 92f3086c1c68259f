#include "lbrun/util/json-utils.hh"
#include "lbrun/util/error.hh"

namespace lbrun {

const nlohmann::json * optionalValueAt(const nlohmann::json::object_t & obj, std::string_view key)
{
    auto i = obj.find(std::string(key));
    return i == obj.end() ? nullptr : &i->second;
}

const nlohmann::json & valueAt(const nlohmann::json::object_t & obj, std::string_view key)
{
    if (auto value = optionalValueAt(obj, key))
        return *value;
    throw Error("JSON object has no member '%s'", key);
}

template<typename T>
static const T & expect(const nlohmann::json & value, nlohmann::json::value_t type)
{
    if (value.type() != type)
        throw Error(
            "expected a JSON %s but got a %s: %s", nlohmann::json(type).type_name(), value.type_name(), value.dump());
    return value.get_ref<const T &>();
}

const nlohmann::json::object_t & getObject(const nlohmann::json & value)
{
    return expect<nlohmann::json::object_t>(value, nlohmann::json::value_t::object);
}

const nlohmann::json::string_t & getString(const nlohmann::json & value)
{
    return expect<nlohmann::json::string_t>(value, nlohmann::json::value_t::string);
}

} // namespace lbrun
