// -*- Mode: C++; c-basic-offset: 4; tab-width: 4; indent-tabs-mode: nil; -*-
#ifndef CARD_CHECK__CONF_READER_H
#define CARD_CHECK__CONF_READER_H

#include <memory>
#include <string>
#include <util/element_tree.h>

class IConfig
{
public:
    typedef std::auto_ptr<IConfig> Ptr;

    virtual ~IConfig();
    virtual const Yb::String get_value(const Yb::String &key) = 0;
    virtual bool has_key(const Yb::String &key) = 0;

    const Yb::String get_value_default(const Yb::String &key,
                                       const Yb::String &default_value);
    int get_value_as_int(const Yb::String &key);
    bool get_value_as_bool(const Yb::String &key);
};

class XmlConfig: public IConfig
{
    const Yb::String fname_;
    Yb::ElementTree::ElementPtr config_;

    static Yb::ElementTree::ElementPtr load_tree(const Yb::String &fname);
    Yb::ElementTree::ElementPtr find_key(const Yb::String &key);
    // non-copyable
    XmlConfig(const XmlConfig &);
    XmlConfig &operator=(const XmlConfig &);
public:
    XmlConfig(const Yb::String &fname);
    virtual const Yb::String get_value(const Yb::String &key);
    virtual bool has_key(const Yb::String &key);
};

// Looks up <prefix><key> in the environment; "Log/@level" is <prefix>Log_level
class EnvConfig: public IConfig
{
    const Yb::String prefix_;

    const Yb::String env_key(const Yb::String &key) const;
public:
    EnvConfig(const Yb::String &prefix);
    virtual const Yb::String get_value(const Yb::String &key);
    virtual bool has_key(const Yb::String &key);
};

// CONFIG_FILE if it exists, otherwise the CARD_CHECK_ environment
IConfig::Ptr open_config(const Yb::String &default_file);

#endif // CARD_CHECK__CONF_READER_H
// vim:ts=4:sts=4:sw=4:et:
