#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "TestSupport.hpp"
#include "adapters/yahoo/ChartDecoder.hpp"
#include "adapters/yahoo/YahooChartClient.hpp"
#include "app/FetchExecutor.hpp"
#include "app/ResponseNormalizer.hpp"

namespace {

// Two sessions (09:30 New York) plus a late intraday stamp repeating the second session.
const std::string kAaplBody = R"JSON({
  "chart": {
    "result": [{
      "meta": {"symbol": "AAPL", "gmtoffset": -18000, "exchangeTimezoneName": "America/New_York"},
      "timestamp": [1704205800, 1704292200, 1704310000],
      "indicators": {
        "quote": [{
          "open": [187.15, 184.22, null],
          "high": [188.44, 185.88, null],
          "low": [183.89, 183.43, null],
          "close": [185.64, 184.25, 186.0],
          "volume": [82488700, 58414500, 60000000]
        }],
        "adjclose": [{"adjclose": [184.94, 183.55, 185.3]}]
      }
    }],
    "error": null
  }
})JSON";

const std::string kNotFoundBody =
    R"JSON({"chart":{"result":null,"error":{"code":"Not Found","description":"No data found, symbol may be delisted"}}})JSON";

const domain::Column* field(const adapters::yahoo::ChartSeries& series, const std::string& label) {
    for (const auto& [name, column] : series.fields) {
        if (name == label) {
            return &column;
        }
    }
    return nullptr;
}

int testDecodeDailyBars() {
    const auto series = adapters::yahoo::decodeChart(kAaplBody, "AAPL");
    EXPECT(series.symbol == "AAPL");
    EXPECT(series.index.size() == 2U);
    EXPECT(series.index[0] == testsupport::epochOf("2024-01-02"));
    EXPECT(series.index[1] == testsupport::epochOf("2024-01-03"));

    const auto* close = field(series, "Close");
    const auto* open = field(series, "Open");
    const auto* adj = field(series, "Adj Close");
    const auto* volume = field(series, "Volume");
    EXPECT(close && open && adj && volume);
    EXPECT(close->size() == 2U);
    EXPECT((*close)[0] && *(*close)[0] == 185.64);
    EXPECT((*close)[1] && *(*close)[1] == 186.0);
    EXPECT((*open)[1] && *(*open)[1] == 184.22);
    EXPECT((*volume)[1] && *(*volume)[1] == 60000000.0);
    EXPECT((*adj)[1] && *(*adj)[1] == 185.3);
    return 0;
}

int testProviderErrorThrows() {
    EXPECT(adapters::yahoo::describeChartError(kNotFoundBody) == "Not Found: No data found, symbol may be delisted");
    EXPECT(adapters::yahoo::describeChartError(kAaplBody).empty());
    EXPECT(adapters::yahoo::describeChartError("not json").empty());

    try {
        adapters::yahoo::decodeChart(kNotFoundBody, "ZZZZ");
        std::cerr << "expected provider error\n";
        return 1;
    } catch (const std::runtime_error& ex) {
        EXPECT(std::string{ex.what()}.find("Not Found") != std::string::npos);
        EXPECT(std::string{ex.what()}.find("ZZZZ") != std::string::npos);
    }
    return 0;
}

int testNonJsonThrottleBodyIsClassified() {
    try {
        adapters::yahoo::decodeChart("Too Many Requests", "AAPL");
        std::cerr << "expected parse error\n";
        return 1;
    } catch (const std::runtime_error& ex) {
        EXPECT(app::FetchExecutor::classify(ex.what()) == app::FetchError::Kind::Throttled);
    }
    return 0;
}

int testEmptyResultDecodesToEmptySeries() {
    const std::string body = R"JSON({"chart":{"result":[{"meta":{"gmtoffset":0},"indicators":{"quote":[{}]}}],"error":null}})JSON";
    const auto series = adapters::yahoo::decodeChart(body, "AAPL");
    EXPECT(series.empty());
    return 0;
}

int testAssembleResponseShapes() {
    const auto aapl = adapters::yahoo::decodeChart(kAaplBody, "AAPL");
    auto msft = aapl;
    msft.symbol = "MSFT";
    msft.index.pop_back();
    for (auto& [label, column] : msft.fields) {
        column.pop_back();
    }

    const auto single = adapters::yahoo::assembleResponse({aapl}, 1);
    EXPECT(std::holds_alternative<domain::SingleTickerFrame>(single));
    EXPECT(app::normalizeResponse(single, {"AAPL"}).size() == 2U);

    const auto multi = adapters::yahoo::assembleResponse({aapl, msft}, 2);
    const auto* frame = std::get_if<domain::MultiTickerFrame>(&multi);
    EXPECT(frame != nullptr);
    EXPECT(frame->axisOrder == domain::AxisOrder::FieldTicker);
    EXPECT(frame->index.size() == 2U);
    const auto rows = app::normalizeResponse(multi, {"AAPL", "MSFT"});
    EXPECT(rows.size() == 3U);

    adapters::yahoo::ChartSeries none;
    none.symbol = "ZZZZ";
    EXPECT(domain::isEmpty(adapters::yahoo::assembleResponse({none}, 1)));
    EXPECT(domain::isEmpty(adapters::yahoo::assembleResponse({none, none}, 2)));
    return 0;
}

int testChartTarget() {
    const domain::FetchWindow window{*domain::Date::parse("2024-01-02"), *domain::Date::parse("2024-01-05")};
    const auto target = adapters::yahoo::YahooChartClient::chartTarget("BRK-B", window);
    EXPECT(target ==
           "/v8/finance/chart/BRK-B?period1=1704153600&period2=1704412800&interval=1d&events=history"
           "&includeAdjustedClose=true");
    EXPECT(adapters::yahoo::YahooChartClient::chartTarget("^GSPC", window).find("/chart/%5EGSPC?") !=
           std::string::npos);
    return 0;
}

}  // namespace

int main() {
    int failures = 0;
    failures += testDecodeDailyBars();
    failures += testProviderErrorThrows();
    failures += testNonJsonThrottleBodyIsClassified();
    failures += testEmptyResultDecodesToEmptySeries();
    failures += testAssembleResponseShapes();
    failures += testChartTarget();
    return failures == 0 ? 0 : 1;
}
