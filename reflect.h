#ifndef REFLECT_H
#define REFLECT_H

#include <string>
#include <vector>
#include <cstdint>
#include <functional>
#include <limits>
#include <type_traits>

#include "rapidjson/document.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

namespace reflect
{

struct JsonReader
{
    rapidjson::Value* m;
    std::vector<std::string> path_;
    std::string invalid_path_;
    bool ok_ = true;

    explicit JsonReader(rapidjson::Value* m) : m(m) {}
    void member(const char* name, const std::function<void()>& fn);
    void set_invalid();
    [[nodiscard]] bool ok() const;
    [[nodiscard]] std::string getPath() const;
};

struct JsonWriter
{
    using W = rapidjson::Writer<rapidjson::StringBuffer>;

    W* m;

    explicit JsonWriter(W* m) : m(m) {}
    void startObject() const;
    void endObject() const;
    void key(const char* name) const;
    void string(const char* s, std::size_t len) const;
};

inline void JsonReader::set_invalid()
{
    if (!ok_)
    {
        return;
    }
    invalid_path_ = getPath();
    ok_ = false;
}
inline bool JsonReader::ok() const { return ok_; }
inline std::string JsonReader::getPath() const
{
    if (!ok_ && !invalid_path_.empty())
    {
        return invalid_path_;
    }
    std::string result = "/";
    for (std::size_t i = 0; i < path_.size(); ++i)
    {
        if (i != 0)
        {
            result.push_back('/');
        }
        result.append(path_[i]);
    }
    return result;
}
inline void JsonReader::member(const char* name, const std::function<void()>& fn)
{
    if (!ok_)
    {
        return;
    }
    path_.emplace_back(name);
    auto it = m->FindMember(name);
    if (it != m->MemberEnd())
    {
        auto* saved = m;
        m = &it->value;
        fn();
        m = saved;
    }
    path_.pop_back();
}

inline void JsonWriter::startObject() const { m->StartObject(); }
inline void JsonWriter::endObject() const { m->EndObject(); }
inline void JsonWriter::key(const char* name) const { m->Key(name); }
inline void JsonWriter::string(const char* s, std::size_t len) const
{
    if (len > static_cast<std::size_t>(std::numeric_limits<rapidjson::SizeType>::max()))
    {
        len = std::numeric_limits<rapidjson::SizeType>::max();
    }
    m->String(s, static_cast<rapidjson::SizeType>(len));
}

template <typename T>
bool read_unsigned_integer(JsonReader& vis, T& out)
{
    if (!vis.m->IsUint64())
    {
        vis.set_invalid();
        return false;
    }
    const auto value = vis.m->GetUint64();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
    {
        vis.set_invalid();
        return false;
    }
    out = static_cast<T>(value);
    return true;
}

inline void reflect(JsonReader& vis, bool& v)
{
    if (!vis.m->IsBool())
    {
        vis.set_invalid();
        return;
    }
    v = vis.m->GetBool();
}
template <typename T, std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>, int> = 0>
inline void reflect(JsonReader& vis, T& v)
{
    (void)read_unsigned_integer(vis, v);
}
inline void reflect(JsonReader& vis, std::string& v)
{
    if (!vis.m->IsString())
    {
        vis.set_invalid();
        return;
    }
    v.assign(vis.m->GetString(), vis.m->GetStringLength());
}

inline void reflect(JsonWriter& vis, bool& v) { vis.m->Bool(v); }
template <typename T, std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>, int> = 0>
inline void reflect(JsonWriter& vis, T& v)
{
    vis.m->Uint64(static_cast<std::uint64_t>(v));
}
inline void reflect(JsonWriter& vis, std::string& v) { vis.string(v.c_str(), v.size()); }

inline void reflectMemberStart(JsonReader& vis)
{
    if (!vis.m->IsObject())
    {
        vis.set_invalid();
    }
}
inline void reflectMemberStart(JsonWriter& vis) { vis.startObject(); }

inline void reflectMemberEnd(JsonReader& vis) { (void)vis; }
inline void reflectMemberEnd(JsonWriter& vis) { vis.endObject(); }

template <typename T>
inline void reflectMember(JsonReader& vis, const char* name, T& v)
{
    if (!vis.ok())
    {
        return;
    }
    vis.member(name, [&]() { reflect(vis, v); });
}
template <typename T>
inline void reflectMember(JsonWriter& vis, const char* name, T& v)
{
    vis.key(name);
    reflect(vis, v);
}

#define REFLECT_MEMBER(name) reflectMember(vis, #name, v.name)

template <typename T>
inline std::string serialize_struct(const T& t)
{
    using non_const_t = std::remove_const_t<T>;
    auto& nt = const_cast<non_const_t&>(t);
    rapidjson::StringBuffer sb;
    rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
    JsonWriter json_writer(&writer);
    reflect(json_writer, nt);
    return sb.GetString();
}

}    // namespace reflect

#endif
