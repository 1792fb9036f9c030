#pragma once

#include "decimal.hpp"
#include "date.hpp"
#include <map>
#include <string>
#include <vector>

struct Quote {
    std::string symbol;
    Decimal price;
    Decimal daily_change;
    Decimal daily_change_percent;
    std::string company_name;
};

// External market-data source. Implementations return what they could get;
// a symbol absent from the result is unavailable. Transport failures that
// lose the whole batch throw.
class QuoteProvider {
public:
    virtual ~QuoteProvider() = default;

    virtual std::map<std::string, Quote> fetch_quotes(const std::vector<std::string>& symbols) = 0;
    virtual std::map<Date, Decimal> fetch_daily_closes(const std::string& symbol,
                                                       const Date& from, const Date& to) = 0;
    virtual bool is_healthy() = 0;
};
