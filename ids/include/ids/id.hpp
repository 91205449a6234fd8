#pragma once

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <compare>
#include <functional>
#include <sstream>
#include <string>

namespace Ids
{
    class Id
    {
      public:
        friend Id generateId();

        Id(Id const&) = default;
        Id(Id&&) = default;
        Id& operator=(Id const&) = default;
        Id& operator=(Id&&) = default;
        ~Id() = default;

        std::string const& value() const
        {
            return id_;
        }

        friend std::strong_ordering operator<=>(Id const& lhs, Id const& rhs) = default;
        friend bool operator==(Id const& lhs, Id const& rhs) = default;

        bool isValid() const
        {
            return id_ != "INVALID_ID";
        }

      protected:
        Id() = delete;
        explicit Id(std::string id)
            : id_{std::move(id)}
        {}

      private:
        std::string id_;
    };

    struct IdHash
    {
        template <typename T>
        std::size_t operator()(T const& id) const
        {
            return std::hash<std::string>{}(id.value());
        }
    };

    inline Id generateId()
    {
        std::stringstream sstr;
        sstr << boost::uuids::random_generator()();
        return Id{sstr.str()};
    }
}

#define DEFINE_ID_TYPE(name) \
    namespace Ids \
    { \
        class name : public Id \
        { \
          public: \
            friend name generate##name(); \
            friend name make##name(std::string const&); \
\
          public: \
            name() \
                : Id{"INVALID_ID"} \
            {} \
\
          private: \
            explicit name(std::string const& str) \
                : Id{str} \
            {} \
        }; \
\
        inline name generate##name() \
        { \
            return name{generateId().value()}; \
        } \
\
        inline name make##name(std::string const& str) \
        { \
            return name{str}; \
        } \
    }
