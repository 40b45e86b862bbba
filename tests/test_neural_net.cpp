#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/neural_net.hpp"
#include "../src/neural_scorer.hpp"
#include <cmath>

using Catch::Matchers::WithinAbs;

namespace {

Tensor sequence(const std::vector<double>& values) {
    Tensor t(values.size(), 1);
    t.data = values;
    return t;
}

// Single-unit LSTM where only the candidate gate sees the input; all other
// gates sit at sigmoid(0) = 0.5
std::unique_ptr<LSTMLayer> candidate_lstm(bool return_sequences, bool go_backwards) {
    return std::make_unique<LSTMLayer>(1, 1, std::vector<double>{0.0, 0.0, 1.0, 0.0},
                                       std::vector<double>{0.0, 0.0, 0.0, 0.0},
                                       std::vector<double>{0.0, 0.0, 0.0, 0.0},
                                       return_sequences, go_backwards);
}

double lstm_step(double& c, double x) {
    c = 0.5 * c + 0.5 * std::tanh(x);
    return 0.5 * std::tanh(c);
}

} // namespace

TEST_CASE("Dense layer", "[neural]") {
    DenseLayer dense(2, 2, {1.0, 2.0, 3.0, 4.0}, {0.5, -0.5}, Activation::Linear);
    Tensor in(1, 2);
    in.data = {1.0, 1.0};
    
    SECTION("Weights are laid out input-major") {
        Tensor out = dense.forward(in);
        REQUIRE_THAT(out.data[0], WithinAbs(4.5, 1e-12));
        REQUIRE_THAT(out.data[1], WithinAbs(5.5, 1e-12));
    }
    
    SECTION("Softmax head sums to one") {
        DenseLayer head(2, 2, {1.0, 2.0, 3.0, 4.0}, {0.5, -0.5}, Activation::Softmax);
        Tensor out = head.forward(in);
        REQUIRE_THAT(out.data[0] + out.data[1], WithinAbs(1.0, 1e-12));
        REQUIRE(out.data[1] > out.data[0]);
    }
    
    SECTION("Mismatched dimensions are rejected") {
        REQUIRE_THROWS_AS(DenseLayer(2, 2, {1.0, 2.0, 3.0}, {0.0, 0.0}, Activation::Relu),
                          std::invalid_argument);
        TensorShape three{1, 3};
        REQUIRE_THROWS_AS(dense.output_shape(three), std::invalid_argument);
    }
}

TEST_CASE("Convolution and pooling", "[neural]") {
    std::vector<double> ones = {1.0, 1.0, 1.0};
    Tensor in = sequence({1.0, 2.0, 3.0, 4.0});
    
    SECTION("Same padding keeps the sequence length") {
        Conv1DLayer conv(3, 1, 1, ones, {0.0}, true, Activation::Linear);
        Tensor out = conv.forward(in);
        REQUIRE(out.steps == 4);
        REQUIRE_THAT(out.at(0, 0), WithinAbs(3.0, 1e-12));
        REQUIRE_THAT(out.at(1, 0), WithinAbs(6.0, 1e-12));
        REQUIRE_THAT(out.at(2, 0), WithinAbs(9.0, 1e-12));
        REQUIRE_THAT(out.at(3, 0), WithinAbs(7.0, 1e-12));
        
        MaxPool1DLayer pool(2);
        Tensor pooled = pool.forward(out);
        REQUIRE(pooled.steps == 2);
        REQUIRE_THAT(pooled.at(0, 0), WithinAbs(6.0, 1e-12));
        REQUIRE_THAT(pooled.at(1, 0), WithinAbs(9.0, 1e-12));
    }
    
    SECTION("Valid padding shortens the sequence") {
        Conv1DLayer conv(3, 1, 1, ones, {1.0}, false, Activation::Linear);
        Tensor out = conv.forward(in);
        REQUIRE(out.steps == 2);
        REQUIRE_THAT(out.at(0, 0), WithinAbs(7.0, 1e-12));
        REQUIRE_THAT(out.at(1, 0), WithinAbs(10.0, 1e-12));
    }
    
    SECTION("Global average and flatten") {
        GlobalAvgPool1DLayer avg;
        REQUIRE_THAT(avg.forward(in).data[0], WithinAbs(2.5, 1e-12));
        
        FlattenLayer flat;
        Tensor f = flat.forward(in);
        REQUIRE(f.steps == 1);
        REQUIRE(f.channels == 4);
    }
    
    SECTION("Batch norm uses frozen statistics") {
        BatchNormLayer bn({2.0}, {1.0}, {3.0}, {4.0}, 0.0);
        Tensor out = bn.forward(in);
        REQUIRE_THAT(out.at(0, 0), WithinAbs(-1.0, 1e-12));
        REQUIRE_THAT(out.at(3, 0), WithinAbs(2.0, 1e-12));
    }
}

TEST_CASE("Recurrent layers", "[neural]") {
    Tensor in = sequence({1.0, 2.0});
    
    SECTION("LSTM final state matches a hand computation") {
        auto lstm = candidate_lstm(false, false);
        double c = 0.0;
        lstm_step(c, 1.0);
        double h = lstm_step(c, 2.0);
        
        Tensor out = lstm->forward(in);
        REQUIRE(out.steps == 1);
        REQUIRE_THAT(out.data[0], WithinAbs(h, 1e-12));
    }
    
    SECTION("Backward LSTM consumes the sequence in reverse") {
        auto lstm = candidate_lstm(false, true);
        double c = 0.0;
        lstm_step(c, 2.0);
        double h = lstm_step(c, 1.0);
        
        REQUIRE_THAT(lstm->forward(in).data[0], WithinAbs(h, 1e-12));
    }
    
    SECTION("Bidirectional outputs are aligned to input time") {
        BidirectionalLayer bi(candidate_lstm(true, false), candidate_lstm(true, true));
        
        double cf = 0.0;
        double f0 = lstm_step(cf, 1.0);
        double f1 = lstm_step(cf, 2.0);
        double cb = 0.0;
        double b1 = lstm_step(cb, 2.0);
        double b0 = lstm_step(cb, 1.0);
        
        Tensor out = bi.forward(in);
        REQUIRE(out.steps == 2);
        REQUIRE(out.channels == 2);
        REQUIRE_THAT(out.at(0, 0), WithinAbs(f0, 1e-12));
        REQUIRE_THAT(out.at(0, 1), WithinAbs(b0, 1e-12));
        REQUIRE_THAT(out.at(1, 0), WithinAbs(f1, 1e-12));
        REQUIRE_THAT(out.at(1, 1), WithinAbs(b1, 1e-12));
    }
}

TEST_CASE("Network loading", "[neural]") {
    SECTION("Sequence network runs end to end and skips dropout") {
        auto artifact = nlohmann::json::parse(R"({
            "type": "neural_net",
            "input": {"layout": "sequence", "shape": [4, 1]},
            "layers": [
                {"type": "conv1d", "weights": [[[1.0]], [[1.0]], [[1.0]]], "bias": [0.0],
                 "padding": "same", "activation": "relu"},
                {"type": "max_pool1d", "pool_size": 2},
                {"type": "dropout", "rate": 0.3},
                {"type": "flatten"},
                {"type": "dense", "weights": [[0.1], [0.1]], "bias": [-1.5], "activation": "sigmoid"}
            ]
        })");
        auto network = NeuralNetwork::from_json(artifact);
        REQUIRE(network->layer_count() == 4);
        REQUIRE(network->input_size() == 4);
        REQUIRE(network->output_size() == 1);
        REQUIRE(network->layout() == InputLayout::Sequence);
        
        // conv: [3, 6, 9, 7] -> pool: [6, 9] -> 0.1 * 15 - 1.5 = 0
        NeuralNetScorer scorer(std::move(network), 0);
        std::vector<double> x = {1.0, 2.0, 3.0, 4.0};
        REQUIRE_THAT(scorer.score(x), WithinAbs(0.5, 1e-12));
    }
    
    SECTION("Two-unit softmax head reports the second unit") {
        auto artifact = nlohmann::json::parse(R"({
            "input": {"layout": "flat", "size": 2},
            "layers": [
                {"type": "dense", "weights": [[1.0, -1.0], [0.0, 0.0]], "bias": [0.0, 0.0],
                 "activation": "softmax"}
            ]
        })");
        auto scorer = NeuralNetScorer::from_json(artifact);
        std::vector<double> x = {2.0, 0.0};
        REQUIRE_THAT(scorer->score(x), WithinAbs(1.0 / (1.0 + std::exp(4.0)), 1e-12));
    }
    
    SECTION("Shape mismatches name the failing layer") {
        auto artifact = nlohmann::json::parse(R"({
            "input": {"layout": "flat", "size": 3},
            "layers": [
                {"type": "dense", "weights": [[1.0], [1.0]], "bias": [0.0]}
            ]
        })");
        REQUIRE_THROWS_AS(NeuralNetwork::from_json(artifact), std::invalid_argument);
    }
    
    SECTION("Unknown layers and activations are rejected") {
        auto unknown_layer = nlohmann::json::parse(R"({
            "input": {"layout": "flat", "size": 1},
            "layers": [{"type": "attention"}]
        })");
        REQUIRE_THROWS_AS(NeuralNetwork::from_json(unknown_layer), std::invalid_argument);
        REQUIRE_THROWS_AS(activation_from_string("gelu"), std::invalid_argument);
    }
    
    SECTION("Wrong input length throws") {
        auto artifact = nlohmann::json::parse(R"({
            "input": {"layout": "flat", "size": 2},
            "layers": [{"type": "dense", "weights": [[1.0], [1.0]], "bias": [0.0]}]
        })");
        auto network = NeuralNetwork::from_json(artifact);
        std::vector<double> x = {1.0};
        REQUIRE_THROWS_AS(network->forward(x), std::invalid_argument);
    }
}
