/**
 * @file test_option_chain.cpp
 * @brief Unit tests for option chain loading and smile extraction
 */

#include <gtest/gtest.h>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include "market/option_chain.hpp"

namespace ivlab::market {
namespace {

using models::BlackScholes;
using solvers::ImpliedVolSolver;

class OptionChainTest : public ::testing::Test {
protected:
    void SetUp() override {
        header.underlying = "XYZ";
        header.expiry = "2024-06-21";
        header.spot = 100.0;
        header.maturity = 0.5;
        header.rate = 0.03;
        header.dividend = 0.01;
    }

    // Smile used to generate synthetic quotes: higher vol on the wings
    static double smile_vol(double strike) {
        double m = std::log(strike / 100.0);
        return 0.2 + 0.5 * m * m - 0.05 * m;
    }

    // CSV for calls and puts on five strikes, priced at smile_vol()
    std::string synthetic_csv() const {
        std::ostringstream csv;
        csv << std::setprecision(10);
        csv << "strike,type,last_price,bid,ask,implied_vol,volume,open_interest\n";
        for (double k : {80.0, 90.0, 100.0, 110.0, 120.0}) {
            MarketInputs inputs(header.spot, k, header.rate, header.maturity, header.dividend);
            double vol = smile_vol(k);
            for (OptionType type : {OptionType::Call, OptionType::Put}) {
                double p = BlackScholes::price(inputs, vol, type);
                csv << k << "," << models::to_string(type) << "," << p << "," << p - 0.05
                    << "," << p + 0.05 << "," << vol + 0.01 << ",150,2000\n";
            }
        }
        return csv.str();
    }

    ChainHeader header;
};

// ============== Parsing Tests ==============

TEST_F(OptionChainTest, ReadSyntheticChain) {
    std::istringstream in(synthetic_csv());
    OptionChain chain = read_option_chain_csv(in, header);

    EXPECT_EQ(chain.underlying, "XYZ");
    EXPECT_EQ(chain.expiry, "2024-06-21");
    EXPECT_DOUBLE_EQ(chain.spot, 100.0);
    ASSERT_EQ(chain.quotes.size(), 10u);
    EXPECT_EQ(chain.calls().size(), 5u);
    EXPECT_EQ(chain.puts().size(), 5u);

    const OptionQuote& first = chain.quotes.front();
    EXPECT_DOUBLE_EQ(first.strike, 80.0);
    EXPECT_EQ(first.type, OptionType::Call);
    EXPECT_EQ(first.volume, 150);
    EXPECT_EQ(first.open_interest, 2000);
    EXPECT_TRUE(first.has_two_sided_market());
    EXPECT_NEAR(first.mid(), first.last_price, 1e-9);
}

TEST_F(OptionChainTest, ColumnOrderAndOptionalColumns) {
    std::istringstream in(
        "Type,Last_Price,Strike,Extra\n"
        "\n"
        "P,1.25,95,ignored\n"
        "  call , 7.5 , 105 ,x\n");
    OptionChain chain = read_option_chain_csv(in, header);

    ASSERT_EQ(chain.quotes.size(), 2u);
    EXPECT_EQ(chain.quotes[0].type, OptionType::Put);
    EXPECT_DOUBLE_EQ(chain.quotes[0].strike, 95.0);
    EXPECT_DOUBLE_EQ(chain.quotes[0].last_price, 1.25);
    EXPECT_DOUBLE_EQ(chain.quotes[0].bid, 0.0);
    EXPECT_FALSE(chain.quotes[0].has_two_sided_market());
    EXPECT_DOUBLE_EQ(chain.quotes[0].mid(), 1.25);

    EXPECT_EQ(chain.quotes[1].type, OptionType::Call);
    EXPECT_DOUBLE_EQ(chain.quotes[1].strike, 105.0);
}

TEST_F(OptionChainTest, EmptyNumericFieldsDefaultToZero) {
    std::istringstream in(
        "strike,type,last_price,bid,ask,volume\n"
        "100,call,5.0,,,12.0\n");
    OptionChain chain = read_option_chain_csv(in, header);
    ASSERT_EQ(chain.quotes.size(), 1u);
    EXPECT_DOUBLE_EQ(chain.quotes[0].bid, 0.0);
    EXPECT_DOUBLE_EQ(chain.quotes[0].ask, 0.0);
    EXPECT_EQ(chain.quotes[0].volume, 12);
}

TEST_F(OptionChainTest, StrikesSortedByType) {
    std::istringstream in(
        "strike,type,last_price\n"
        "110,call,2\n"
        "90,call,12\n"
        "100,put,4\n"
        "100,call,6\n");
    OptionChain chain = read_option_chain_csv(in, header);
    EXPECT_EQ(chain.strikes(OptionType::Call), (std::vector<double>{90.0, 100.0, 110.0}));
    EXPECT_EQ(chain.strikes(OptionType::Put), (std::vector<double>{100.0}));
}

TEST_F(OptionChainTest, MarketInputsFromChain) {
    OptionChain chain;
    chain.spot = 50.0;
    chain.rate = 0.02;
    chain.maturity = 0.25;
    chain.dividend = 0.01;
    OptionQuote quote;
    quote.strike = 55.0;

    MarketInputs inputs = chain.market_inputs(quote);
    EXPECT_DOUBLE_EQ(inputs.spot, 50.0);
    EXPECT_DOUBLE_EQ(inputs.strike, 55.0);
    EXPECT_DOUBLE_EQ(inputs.rate, 0.02);
    EXPECT_DOUBLE_EQ(inputs.maturity, 0.25);
    EXPECT_DOUBLE_EQ(inputs.dividend, 0.01);
}

TEST_F(OptionChainTest, ChainToString) {
    std::istringstream in(synthetic_csv());
    std::string str = read_option_chain_csv(in, header).to_string();
    EXPECT_NE(str.find("underlying=XYZ"), std::string::npos);
    EXPECT_NE(str.find("quotes=10"), std::string::npos);
}

// ============== Parse Error Tests ==============

TEST_F(OptionChainTest, MissingHeaderThrows) {
    std::istringstream in("\n\n");
    EXPECT_THROW(read_option_chain_csv(in, header), std::runtime_error);
}

TEST_F(OptionChainTest, MissingRequiredColumnThrows) {
    std::istringstream in("strike,type,bid\n100,call,1\n");
    try {
        read_option_chain_csv(in, header);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("last_price"), std::string::npos);
    }
}

TEST_F(OptionChainTest, MalformedNumberReportsLine) {
    std::istringstream in(
        "strike,type,last_price\n"
        "100,call,5\n"
        "105,call,abc\n");
    try {
        read_option_chain_csv(in, header);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("line 3"), std::string::npos) << what;
        EXPECT_NE(what.find("last_price"), std::string::npos) << what;
    }
}

TEST_F(OptionChainTest, CountOutOfRangeThrows) {
    std::istringstream huge("strike,type,last_price,volume\n100,call,5,1e30\n");
    try {
        read_option_chain_csv(huge, header);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("line 2"), std::string::npos) << what;
        EXPECT_NE(what.find("volume"), std::string::npos) << what;
    }

    std::istringstream negative("strike,type,last_price,open_interest\n100,call,5,-3\n");
    EXPECT_THROW(read_option_chain_csv(negative, header), std::runtime_error);
}

TEST_F(OptionChainTest, BadTypeThrows) {
    std::istringstream in("strike,type,last_price\n100,straddle,5\n");
    EXPECT_THROW(read_option_chain_csv(in, header), std::runtime_error);
}

TEST_F(OptionChainTest, NonPositiveStrikeThrows) {
    std::istringstream in("strike,type,last_price\n0,call,5\n");
    EXPECT_THROW(read_option_chain_csv(in, header), std::runtime_error);
}

TEST_F(OptionChainTest, ShortRowThrows) {
    std::istringstream in("strike,type,last_price\n100,call\n");
    EXPECT_THROW(read_option_chain_csv(in, header), std::runtime_error);
}

TEST_F(OptionChainTest, MissingFileThrows) {
    EXPECT_THROW(load_option_chain_csv("/nonexistent/chain.csv", header), std::runtime_error);
}

TEST_F(OptionChainTest, LoadFromFile) {
    std::string path = ::testing::TempDir() + "ivlab_chain_test.csv";
    {
        std::ofstream out(path);
        out << synthetic_csv();
    }
    OptionChain chain = load_option_chain_csv(path, header);
    EXPECT_EQ(chain.quotes.size(), 10u);
    std::remove(path.c_str());
}

// ============== Smile Tests ==============

TEST_F(OptionChainTest, SmileRecoversGeneratingVols) {
    std::istringstream in(synthetic_csv());
    OptionChain chain = read_option_chain_csv(in, header);
    ImpliedVolSolver solver;

    for (OptionType type : {OptionType::Call, OptionType::Put}) {
        VolSmile smile = compute_smile(chain, type, solver);
        ASSERT_EQ(smile.size(), 5u);
        EXPECT_EQ(smile.n_converged, 5u);
        EXPECT_EQ(smile.type, type);
        for (Eigen::Index i = 0; i < 5; ++i) {
            if (i > 0) {
                EXPECT_GT(smile.strikes(i), smile.strikes(i - 1));
            }
            EXPECT_EQ(smile.converged(i), 1);
            // CSV carries 10 significant digits of price
            EXPECT_NEAR(smile.model_vols(i), smile_vol(smile.strikes(i)), 1e-6)
                << models::to_string(type) << " K=" << smile.strikes(i);
        }
    }
}

TEST_F(OptionChainTest, SmileFromMidPrices) {
    std::istringstream in(synthetic_csv());
    OptionChain chain = read_option_chain_csv(in, header);

    // Bid/ask are symmetric around last, so both sources agree
    VolSmile last = compute_smile(chain, OptionType::Call, ImpliedVolSolver(), PriceSource::Last);
    VolSmile mid = compute_smile(chain, OptionType::Call, ImpliedVolSolver(), PriceSource::Mid);
    ASSERT_EQ(mid.size(), last.size());
    for (Eigen::Index i = 0; i < 5; ++i) {
        EXPECT_NEAR(mid.model_vols(i), last.model_vols(i), 1e-6);
    }
}

TEST_F(OptionChainTest, SmileKeepsUnsolvableQuotes) {
    std::istringstream in(
        "strike,type,last_price\n"
        "100,call,0\n"
        "90,call,500\n"
        "110,call,3.5\n");
    OptionChain chain = read_option_chain_csv(in, header);
    VolSmile smile = compute_smile(chain, OptionType::Call, ImpliedVolSolver());

    ASSERT_EQ(smile.size(), 3u);
    EXPECT_EQ(smile.n_converged, 1u);
    EXPECT_TRUE(std::isnan(smile.model_vols(0)));  // K=90, above spot
    EXPECT_TRUE(std::isnan(smile.model_vols(1)));  // K=100, zero price
    EXPECT_EQ(smile.converged(2), 1);
    EXPECT_GT(smile.model_vols(2), 0.0);
}

TEST_F(OptionChainTest, SummarizeSmile) {
    std::istringstream in(synthetic_csv());
    OptionChain chain = read_option_chain_csv(in, header);
    VolSmile smile = compute_smile(chain, OptionType::Put, ImpliedVolSolver());
    SmileSummary summary = summarize_smile(smile);

    EXPECT_EQ(summary.n_points, 5u);
    EXPECT_NEAR(summary.min_model_vol, smile_vol(110.0), 1e-6);
    EXPECT_NEAR(summary.max_model_vol, smile_vol(80.0), 1e-6);
    EXPECT_GT(summary.std_model_vol, 0.0);
    // Provider vols were written 1 point above the generating vols
    EXPECT_NEAR(summary.mean_abs_provider_diff, 0.01, 1e-6);

    double expected_mean = 0.0;
    for (double k : {80.0, 90.0, 100.0, 110.0, 120.0}) expected_mean += smile_vol(k) / 5.0;
    EXPECT_NEAR(summary.mean_model_vol, expected_mean, 1e-6);
}

TEST_F(OptionChainTest, SummarizeSinglePoint) {
    std::istringstream in("strike,type,last_price\n100,put,5.0\n");
    OptionChain chain = read_option_chain_csv(in, header);
    SmileSummary summary = summarize_smile(compute_smile(chain, OptionType::Put,
                                                         ImpliedVolSolver()));
    EXPECT_EQ(summary.n_points, 1u);
    EXPECT_DOUBLE_EQ(summary.std_model_vol, 0.0);
    EXPECT_DOUBLE_EQ(summary.min_model_vol, summary.max_model_vol);
    EXPECT_TRUE(std::isnan(summary.mean_abs_provider_diff));
}

TEST_F(OptionChainTest, SummarizeWithoutConvergedPointsThrows) {
    std::istringstream in("strike,type,last_price\n100,call,500\n");
    OptionChain chain = read_option_chain_csv(in, header);
    VolSmile smile = compute_smile(chain, OptionType::Call, ImpliedVolSolver());
    EXPECT_EQ(smile.n_converged, 0u);
    EXPECT_THROW(summarize_smile(smile), std::invalid_argument);

    VolSmile empty = compute_smile(chain, OptionType::Put, ImpliedVolSolver());
    EXPECT_EQ(empty.size(), 0u);
    EXPECT_THROW(summarize_smile(empty), std::invalid_argument);
}

}  // namespace
}  // namespace ivlab::market
