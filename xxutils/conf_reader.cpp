// -*- Mode: C++; c-basic-offset: 4; tab-width: 4; indent-tabs-mode: nil; -*-
#include <cstdlib>
#include <stdexcept>
#include <util/string_utils.h>
#include "conf_reader.h"
#include "utils.h"

IConfig::~IConfig() {}

const Yb::String IConfig::get_value_default(const Yb::String &key,
                                            const Yb::String &default_value)
{
    if (!has_key(key))
        return default_value;
    return get_value(key);
}

int IConfig::get_value_as_int(const Yb::String &key)
{
    Yb::String value = get_value(key);
    int result = -1;
    Yb::from_string(value, result);
    return result;
}

bool IConfig::get_value_as_bool(const Yb::String &key)
{
    Yb::String value = Yb::StrUtils::str_to_upper(get_value(key));
    return value == _T("1") || value == _T("YES") || value == _T("ON") ||
           value == _T("TRUE") || value == _T("Y") || value == _T("T");
}

Yb::ElementTree::ElementPtr XmlConfig::load_tree(const Yb::String &fname)
{
    if (!file_exists(NARROW(fname)))
        throw RunTimeError("can't open config file: " + NARROW(fname));
    Yb::ElementTree::ElementPtr root = Yb::ElementTree::parse_file(fname);
    return root;
}

Yb::ElementTree::ElementPtr XmlConfig::find_key(const Yb::String &key)
{
    Yb::Strings parts;
    Yb::StrUtils::split_str(key, _T("/"), parts);
    Yb::ElementTree::ElementPtr cur_node = config_;
    for (size_t i = 0; i < parts.size(); ++i)
    {
        cur_node = cur_node->find_first(parts[i]);
    }
    return cur_node;
}

XmlConfig::XmlConfig(const Yb::String &fname)
    : fname_(fname)
    , config_(load_tree(fname))
{}

const Yb::String XmlConfig::get_value(const Yb::String &key)
{
    return find_key(key)->get_text();
}

bool XmlConfig::has_key(const Yb::String &key)
{
    try {
        get_value(key);
        return true;
    }
    catch (const Yb::ElementTree::ElementNotFound &) { }
    return false;
}

EnvConfig::EnvConfig(const Yb::String &prefix)
    : prefix_(prefix)
{}

const Yb::String EnvConfig::env_key(const Yb::String &key) const
{
    Yb::String result = prefix_;
    for (size_t i = 0; i < key.size(); ++i) {
        if (key[i] == _T('/'))
            result += _T('_');
        else if (key[i] != _T('@'))
            result += key[i];
    }
    return result;
}

const Yb::String EnvConfig::get_value(const Yb::String &key)
{
    Yb::String name = env_key(key);
    char *x = getenv(NARROW(name).c_str());
    if (!x)
        throw RunTimeError("No environment variable: " + NARROW(name));
    return Yb::StrUtils::xgetenv(name);
}

bool EnvConfig::has_key(const Yb::String &key)
{
    return getenv(NARROW(env_key(key)).c_str()) != NULL;
}

IConfig::Ptr open_config(const Yb::String &default_file)
{
    Yb::String config_file = Yb::StrUtils::xgetenv(_T("CONFIG_FILE"));
    if (!config_file.size())
        config_file = default_file;
    if (file_exists(NARROW(config_file)))
        return IConfig::Ptr(new XmlConfig(config_file));
    return IConfig::Ptr(new EnvConfig(_T("CARD_CHECK_")));
}

// vim:ts=4:sts=4:sw=4:et:
