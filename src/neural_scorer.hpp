#pragma once

#include "scorer.hpp"
#include "neural_net.hpp"

// Feed-forward, convolutional and recurrent classifiers
class NeuralNetScorer : public Scorer {
public:
    // output_index selects the positive-class unit when the head has several
    NeuralNetScorer(std::unique_ptr<NeuralNetwork> network, size_t output_index);
    
    static std::shared_ptr<NeuralNetScorer> from_json(const nlohmann::json& artifact);
    
    double score(const std::vector<double>& x) const override;
    size_t input_size() const override { return network_->input_size(); }
    std::string algorithm() const override { return "neural_net"; }
    
    InputLayout layout() const { return network_->layout(); }
    
private:
    std::unique_ptr<NeuralNetwork> network_;
    size_t output_index_;
};

enum class ErrorMapping {
    MinMax,     // (err - lo) / (hi - lo), clipped
    Logistic    // sigmoid((err - center) / scale)
};

// Autoencoder: the fraud score is the mapped reconstruction error
class ReconstructionScorer : public Scorer {
public:
    ReconstructionScorer(std::unique_ptr<NeuralNetwork> network, ErrorMapping mapping,
                         double a, double b);
    
    static std::shared_ptr<ReconstructionScorer> from_json(const nlohmann::json& artifact);
    
    double score(const std::vector<double>& x) const override;
    size_t input_size() const override { return network_->input_size(); }
    std::string algorithm() const override { return "autoencoder"; }
    
    // Mean squared error between input and reconstruction
    double reconstruction_error(const std::vector<double>& x) const;
    
private:
    std::unique_ptr<NeuralNetwork> network_;
    ErrorMapping mapping_;
    double a_;   // lo or center
    double b_;   // hi or scale
};
