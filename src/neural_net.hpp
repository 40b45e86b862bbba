#pragma once

#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

// Row-major [steps][channels]; flat inputs are a single step
struct Tensor {
    std::vector<double> data;
    size_t steps = 0;
    size_t channels = 0;
    
    Tensor() = default;
    Tensor(size_t s, size_t c) : data(s * c, 0.0), steps(s), channels(c) {}
    
    double& at(size_t t, size_t c) { return data[t * channels + c]; }
    double at(size_t t, size_t c) const { return data[t * channels + c]; }
};

struct TensorShape {
    size_t steps = 0;
    size_t channels = 0;
};

enum class Activation {
    Linear,
    Relu,
    Sigmoid,
    Tanh,
    Softmax
};

Activation activation_from_string(const std::string& name);

class Layer {
public:
    virtual ~Layer() = default;
    
    virtual Tensor forward(const Tensor& in) const = 0;
    
    // Throws std::invalid_argument when `in` cannot feed this layer
    virtual TensorShape output_shape(const TensorShape& in) const = 0;
    
    virtual std::string kind() const = 0;
};

class DenseLayer : public Layer {
public:
    // weights is [in][out], applied independently at every step
    DenseLayer(size_t in, size_t out, std::vector<double> weights,
               std::vector<double> bias, Activation activation);
    
    Tensor forward(const Tensor& in) const override;
    TensorShape output_shape(const TensorShape& in) const override;
    std::string kind() const override { return "dense"; }
    
private:
    size_t in_;
    size_t out_;
    std::vector<double> weights_;
    std::vector<double> bias_;
    Activation activation_;
};

class Conv1DLayer : public Layer {
public:
    // weights is [kernel][in_channels][filters], stride 1
    Conv1DLayer(size_t kernel, size_t in_channels, size_t filters,
                std::vector<double> weights, std::vector<double> bias,
                bool same_padding, Activation activation);
    
    Tensor forward(const Tensor& in) const override;
    TensorShape output_shape(const TensorShape& in) const override;
    std::string kind() const override { return "conv1d"; }
    
private:
    size_t kernel_;
    size_t in_channels_;
    size_t filters_;
    std::vector<double> weights_;
    std::vector<double> bias_;
    bool same_padding_;
    Activation activation_;
};

class MaxPool1DLayer : public Layer {
public:
    explicit MaxPool1DLayer(size_t pool_size);
    
    Tensor forward(const Tensor& in) const override;
    TensorShape output_shape(const TensorShape& in) const override;
    std::string kind() const override { return "max_pool1d"; }
    
private:
    size_t pool_size_;
};

class GlobalAvgPool1DLayer : public Layer {
public:
    Tensor forward(const Tensor& in) const override;
    TensorShape output_shape(const TensorShape& in) const override;
    std::string kind() const override { return "global_avg_pool1d"; }
};

class FlattenLayer : public Layer {
public:
    Tensor forward(const Tensor& in) const override;
    TensorShape output_shape(const TensorShape& in) const override;
    std::string kind() const override { return "flatten"; }
};

// Inference-time batch norm with frozen moving statistics
class BatchNormLayer : public Layer {
public:
    BatchNormLayer(std::vector<double> gamma, std::vector<double> beta,
                   std::vector<double> moving_mean, std::vector<double> moving_variance,
                   double epsilon);
    
    Tensor forward(const Tensor& in) const override;
    TensorShape output_shape(const TensorShape& in) const override;
    std::string kind() const override { return "batch_norm"; }
    
private:
    std::vector<double> scale_;
    std::vector<double> shift_;
};

class LSTMLayer : public Layer {
public:
    // Gate order i, f, c, o. kernel is [in][4*units], recurrent [units][4*units]
    LSTMLayer(size_t in, size_t units, std::vector<double> kernel,
              std::vector<double> recurrent, std::vector<double> bias,
              bool return_sequences, bool go_backwards = false);
    
    Tensor forward(const Tensor& in) const override;
    TensorShape output_shape(const TensorShape& in) const override;
    std::string kind() const override { return "lstm"; }
    
    size_t units() const { return units_; }
    bool returns_sequences() const { return return_sequences_; }
    
private:
    size_t in_;
    size_t units_;
    std::vector<double> kernel_;
    std::vector<double> recurrent_;
    std::vector<double> bias_;
    bool return_sequences_;
    bool go_backwards_;
};

// Concatenates a forward and a backward LSTM; backward outputs are
// realigned to input time order when sequences are returned
class BidirectionalLayer : public Layer {
public:
    BidirectionalLayer(std::unique_ptr<LSTMLayer> forward, std::unique_ptr<LSTMLayer> backward);
    
    Tensor forward(const Tensor& in) const override;
    TensorShape output_shape(const TensorShape& in) const override;
    std::string kind() const override { return "bidirectional"; }
    
private:
    std::unique_ptr<LSTMLayer> forward_;
    std::unique_ptr<LSTMLayer> backward_;
};

enum class InputLayout {
    Flat,      // one step of N channels
    Sequence   // [steps][channels] with steps * channels == N
};

class NeuralNetwork {
public:
    NeuralNetwork(InputLayout layout, TensorShape input_shape,
                  std::vector<std::unique_ptr<Layer>> layers);
    
    // Reads {"input": {...}, "layers": [...]}. Dropout layers are skipped.
    static std::unique_ptr<NeuralNetwork> from_json(const nlohmann::json& artifact);
    
    Tensor forward(const std::vector<double>& x) const;
    
    size_t input_size() const { return input_shape_.steps * input_shape_.channels; }
    size_t output_size() const { return output_shape_.steps * output_shape_.channels; }
    InputLayout layout() const { return layout_; }
    size_t layer_count() const { return layers_.size(); }
    
private:
    InputLayout layout_;
    TensorShape input_shape_;
    TensorShape output_shape_;
    std::vector<std::unique_ptr<Layer>> layers_;
};
