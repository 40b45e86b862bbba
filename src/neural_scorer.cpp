#include "neural_scorer.hpp"
#include "util.hpp"
#include <stdexcept>

NeuralNetScorer::NeuralNetScorer(std::unique_ptr<NeuralNetwork> network, size_t output_index)
    : network_(std::move(network)), output_index_(output_index)
{
    if (!network_) {
        throw std::invalid_argument("neural scorer needs a network");
    }
    if (output_index_ >= network_->output_size()) {
        throw std::invalid_argument("output_index " + std::to_string(output_index_) +
                                    " outside network output of size " +
                                    std::to_string(network_->output_size()));
    }
}

std::shared_ptr<NeuralNetScorer> NeuralNetScorer::from_json(const nlohmann::json& artifact) {
    auto network = NeuralNetwork::from_json(artifact);
    // A two-unit softmax head reports the fraud class in unit 1
    size_t default_index = network->output_size() > 1 ? 1 : 0;
    size_t index = artifact.value("output_index", default_index);
    return std::make_shared<NeuralNetScorer>(std::move(network), index);
}

double NeuralNetScorer::score(const std::vector<double>& x) const {
    Tensor out = network_->forward(x);
    return out.data[output_index_];
}

ReconstructionScorer::ReconstructionScorer(std::unique_ptr<NeuralNetwork> network,
                                           ErrorMapping mapping, double a, double b)
    : network_(std::move(network)), mapping_(mapping), a_(a), b_(b)
{
    if (!network_) {
        throw std::invalid_argument("reconstruction scorer needs a network");
    }
    if (network_->output_size() != network_->input_size()) {
        throw std::invalid_argument("autoencoder output size must equal its input size");
    }
    if (mapping_ == ErrorMapping::MinMax && !(b_ > a_)) {
        throw std::invalid_argument("minmax error mapping needs hi > lo");
    }
    if (mapping_ == ErrorMapping::Logistic && !(b_ > 0.0)) {
        throw std::invalid_argument("logistic error mapping needs scale > 0");
    }
}

std::shared_ptr<ReconstructionScorer> ReconstructionScorer::from_json(const nlohmann::json& artifact) {
    auto network = NeuralNetwork::from_json(artifact);
    
    const auto& mapping = artifact.at("error_mapping");
    std::string method = mapping.value("method", "minmax");
    if (method == "minmax") {
        return std::make_shared<ReconstructionScorer>(
            std::move(network), ErrorMapping::MinMax,
            mapping.at("lo").get<double>(), mapping.at("hi").get<double>());
    }
    if (method == "logistic") {
        return std::make_shared<ReconstructionScorer>(
            std::move(network), ErrorMapping::Logistic,
            mapping.at("center").get<double>(), mapping.at("scale").get<double>());
    }
    throw std::invalid_argument("unknown error mapping: " + method);
}

double ReconstructionScorer::reconstruction_error(const std::vector<double>& x) const {
    Tensor out = network_->forward(x);
    double sum = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        double d = out.data[i] - x[i];
        sum += d * d;
    }
    return sum / static_cast<double>(x.size());
}

double ReconstructionScorer::score(const std::vector<double>& x) const {
    double err = reconstruction_error(x);
    if (mapping_ == ErrorMapping::MinMax) {
        return util::clamp01((err - a_) / (b_ - a_));
    }
    return util::sigmoid((err - a_) / b_);
}
