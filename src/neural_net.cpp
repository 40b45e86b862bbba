#include "neural_net.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace {

void apply_activation(Activation activation, double* v, size_t n) {
    switch (activation) {
        case Activation::Linear:
            return;
        case Activation::Relu:
            for (size_t i = 0; i < n; ++i) v[i] = std::max(0.0, v[i]);
            return;
        case Activation::Sigmoid:
            for (size_t i = 0; i < n; ++i) v[i] = util::sigmoid(v[i]);
            return;
        case Activation::Tanh:
            for (size_t i = 0; i < n; ++i) v[i] = std::tanh(v[i]);
            return;
        case Activation::Softmax: {
            double peak = *std::max_element(v, v + n);
            double sum = 0.0;
            for (size_t i = 0; i < n; ++i) {
                v[i] = std::exp(v[i] - peak);
                sum += v[i];
            }
            for (size_t i = 0; i < n; ++i) v[i] /= sum;
            return;
        }
    }
}

std::vector<double> read_vector(const nlohmann::json& j, const std::string& what) {
    if (!j.is_array()) {
        throw std::invalid_argument(what + " must be an array");
    }
    return j.get<std::vector<double>>();
}

// Flattens a rectangular 2-D array row-major
std::vector<double> read_matrix(const nlohmann::json& j, const std::string& what,
                                size_t& rows, size_t& cols) {
    if (!j.is_array() || j.empty() || !j[0].is_array()) {
        throw std::invalid_argument(what + " must be a non-empty 2-D array");
    }
    rows = j.size();
    cols = j[0].size();
    std::vector<double> flat;
    flat.reserve(rows * cols);
    for (const auto& row : j) {
        if (!row.is_array() || row.size() != cols) {
            throw std::invalid_argument(what + " is not rectangular");
        }
        for (const auto& v : row) flat.push_back(v.get<double>());
    }
    return flat;
}

std::vector<double> read_tensor3(const nlohmann::json& j, const std::string& what,
                                 size_t& d0, size_t& d1, size_t& d2) {
    if (!j.is_array() || j.empty()) {
        throw std::invalid_argument(what + " must be a non-empty 3-D array");
    }
    d0 = j.size();
    std::vector<double> flat;
    for (size_t k = 0; k < d0; ++k) {
        size_t r = 0, c = 0;
        auto slice = read_matrix(j[k], what, r, c);
        if (k == 0) {
            d1 = r;
            d2 = c;
        } else if (r != d1 || c != d2) {
            throw std::invalid_argument(what + " is not rectangular");
        }
        flat.insert(flat.end(), slice.begin(), slice.end());
    }
    return flat;
}

std::unique_ptr<LSTMLayer> parse_lstm(const nlohmann::json& def, bool go_backwards) {
    size_t in = 0, four_units = 0, units = 0, rec_cols = 0;
    auto kernel = read_matrix(def.at("kernel"), "lstm kernel", in, four_units);
    auto recurrent = read_matrix(def.at("recurrent_kernel"), "lstm recurrent_kernel", units, rec_cols);
    auto bias = read_vector(def.at("bias"), "lstm bias");
    return std::make_unique<LSTMLayer>(in, units, std::move(kernel), std::move(recurrent),
                                       std::move(bias), def.value("return_sequences", false),
                                       go_backwards);
}

std::unique_ptr<Layer> parse_layer(const nlohmann::json& def) {
    std::string type = def.at("type").get<std::string>();
    Activation activation = activation_from_string(def.value("activation", "linear"));
    
    if (type == "dense") {
        size_t in = 0, out = 0;
        auto weights = read_matrix(def.at("weights"), "dense weights", in, out);
        return std::make_unique<DenseLayer>(in, out, std::move(weights),
                                            read_vector(def.at("bias"), "dense bias"), activation);
    }
    if (type == "conv1d") {
        size_t kernel = 0, channels = 0, filters = 0;
        auto weights = read_tensor3(def.at("weights"), "conv1d weights", kernel, channels, filters);
        std::string padding = def.value("padding", "valid");
        if (padding != "valid" && padding != "same") {
            throw std::invalid_argument("unknown conv1d padding: " + padding);
        }
        return std::make_unique<Conv1DLayer>(kernel, channels, filters, std::move(weights),
                                             read_vector(def.at("bias"), "conv1d bias"),
                                             padding == "same", activation);
    }
    if (type == "max_pool1d") {
        return std::make_unique<MaxPool1DLayer>(def.value("pool_size", 2));
    }
    if (type == "global_avg_pool1d") {
        return std::make_unique<GlobalAvgPool1DLayer>();
    }
    if (type == "flatten") {
        return std::make_unique<FlattenLayer>();
    }
    if (type == "batch_norm") {
        return std::make_unique<BatchNormLayer>(
            read_vector(def.at("gamma"), "batch_norm gamma"),
            read_vector(def.at("beta"), "batch_norm beta"),
            read_vector(def.at("moving_mean"), "batch_norm moving_mean"),
            read_vector(def.at("moving_variance"), "batch_norm moving_variance"),
            def.value("epsilon", 1e-3));
    }
    if (type == "lstm") {
        return parse_lstm(def, false);
    }
    if (type == "bidirectional") {
        return std::make_unique<BidirectionalLayer>(parse_lstm(def.at("forward"), false),
                                                    parse_lstm(def.at("backward"), true));
    }
    throw std::invalid_argument("unknown layer type: " + type);
}

} // namespace

Activation activation_from_string(const std::string& name) {
    if (name == "linear" || name.empty()) return Activation::Linear;
    if (name == "relu") return Activation::Relu;
    if (name == "sigmoid") return Activation::Sigmoid;
    if (name == "tanh") return Activation::Tanh;
    if (name == "softmax") return Activation::Softmax;
    throw std::invalid_argument("unknown activation: " + name);
}

// ---- Dense ----

DenseLayer::DenseLayer(size_t in, size_t out, std::vector<double> weights,
                       std::vector<double> bias, Activation activation)
    : in_(in), out_(out), weights_(std::move(weights)), bias_(std::move(bias)), activation_(activation)
{
    if (in_ == 0 || out_ == 0 || weights_.size() != in_ * out_ || bias_.size() != out_) {
        throw std::invalid_argument("dense layer dimensions do not match");
    }
}

TensorShape DenseLayer::output_shape(const TensorShape& in) const {
    if (in.channels != in_) {
        throw std::invalid_argument("dense layer expects " + std::to_string(in_) +
                                    " channels, got " + std::to_string(in.channels));
    }
    return {in.steps, out_};
}

Tensor DenseLayer::forward(const Tensor& in) const {
    Tensor out(in.steps, out_);
    for (size_t t = 0; t < in.steps; ++t) {
        double* row = &out.data[t * out_];
        std::copy(bias_.begin(), bias_.end(), row);
        for (size_t i = 0; i < in_; ++i) {
            double xi = in.at(t, i);
            if (xi == 0.0) continue;
            const double* w = &weights_[i * out_];
            for (size_t o = 0; o < out_; ++o) row[o] += xi * w[o];
        }
        apply_activation(activation_, row, out_);
    }
    return out;
}

// ---- Conv1D ----

Conv1DLayer::Conv1DLayer(size_t kernel, size_t in_channels, size_t filters,
                         std::vector<double> weights, std::vector<double> bias,
                         bool same_padding, Activation activation)
    : kernel_(kernel), in_channels_(in_channels), filters_(filters)
    , weights_(std::move(weights)), bias_(std::move(bias))
    , same_padding_(same_padding), activation_(activation)
{
    if (kernel_ == 0 || filters_ == 0 ||
        weights_.size() != kernel_ * in_channels_ * filters_ || bias_.size() != filters_) {
        throw std::invalid_argument("conv1d layer dimensions do not match");
    }
}

TensorShape Conv1DLayer::output_shape(const TensorShape& in) const {
    if (in.channels != in_channels_) {
        throw std::invalid_argument("conv1d expects " + std::to_string(in_channels_) +
                                    " channels, got " + std::to_string(in.channels));
    }
    if (same_padding_) {
        return {in.steps, filters_};
    }
    if (in.steps < kernel_) {
        throw std::invalid_argument("conv1d kernel longer than input sequence");
    }
    return {in.steps - kernel_ + 1, filters_};
}

Tensor Conv1DLayer::forward(const Tensor& in) const {
    TensorShape shape = output_shape({in.steps, in.channels});
    const long pad_left = same_padding_ ? static_cast<long>((kernel_ - 1) / 2) : 0;
    
    Tensor out(shape.steps, filters_);
    for (size_t t = 0; t < shape.steps; ++t) {
        double* row = &out.data[t * filters_];
        std::copy(bias_.begin(), bias_.end(), row);
        for (size_t k = 0; k < kernel_; ++k) {
            long src = static_cast<long>(t + k) - pad_left;
            if (src < 0 || src >= static_cast<long>(in.steps)) continue;
            for (size_t c = 0; c < in_channels_; ++c) {
                double xv = in.at(static_cast<size_t>(src), c);
                const double* w = &weights_[(k * in_channels_ + c) * filters_];
                for (size_t f = 0; f < filters_; ++f) row[f] += xv * w[f];
            }
        }
        apply_activation(activation_, row, filters_);
    }
    return out;
}

// ---- Pooling / reshaping ----

MaxPool1DLayer::MaxPool1DLayer(size_t pool_size) : pool_size_(pool_size) {
    if (pool_size_ == 0) {
        throw std::invalid_argument("max_pool1d pool_size must be positive");
    }
}

TensorShape MaxPool1DLayer::output_shape(const TensorShape& in) const {
    if (in.steps < pool_size_) {
        throw std::invalid_argument("max_pool1d window longer than input sequence");
    }
    return {in.steps / pool_size_, in.channels};
}

Tensor MaxPool1DLayer::forward(const Tensor& in) const {
    TensorShape shape = output_shape({in.steps, in.channels});
    Tensor out(shape.steps, shape.channels);
    for (size_t t = 0; t < shape.steps; ++t) {
        for (size_t c = 0; c < in.channels; ++c) {
            double best = -std::numeric_limits<double>::infinity();
            for (size_t k = 0; k < pool_size_; ++k) {
                best = std::max(best, in.at(t * pool_size_ + k, c));
            }
            out.at(t, c) = best;
        }
    }
    return out;
}

TensorShape GlobalAvgPool1DLayer::output_shape(const TensorShape& in) const {
    if (in.steps == 0) {
        throw std::invalid_argument("global_avg_pool1d on empty sequence");
    }
    return {1, in.channels};
}

Tensor GlobalAvgPool1DLayer::forward(const Tensor& in) const {
    Tensor out(1, in.channels);
    for (size_t t = 0; t < in.steps; ++t) {
        for (size_t c = 0; c < in.channels; ++c) out.at(0, c) += in.at(t, c);
    }
    for (auto& v : out.data) v /= static_cast<double>(in.steps);
    return out;
}

TensorShape FlattenLayer::output_shape(const TensorShape& in) const {
    return {1, in.steps * in.channels};
}

Tensor FlattenLayer::forward(const Tensor& in) const {
    Tensor out;
    out.data = in.data;
    out.steps = 1;
    out.channels = in.steps * in.channels;
    return out;
}

BatchNormLayer::BatchNormLayer(std::vector<double> gamma, std::vector<double> beta,
                               std::vector<double> moving_mean, std::vector<double> moving_variance,
                               double epsilon)
{
    const size_t n = gamma.size();
    if (n == 0 || beta.size() != n || moving_mean.size() != n || moving_variance.size() != n) {
        throw std::invalid_argument("batch_norm parameter sizes do not match");
    }
    scale_.resize(n);
    shift_.resize(n);
    for (size_t i = 0; i < n; ++i) {
        scale_[i] = gamma[i] / std::sqrt(moving_variance[i] + epsilon);
        shift_[i] = beta[i] - moving_mean[i] * scale_[i];
    }
}

TensorShape BatchNormLayer::output_shape(const TensorShape& in) const {
    if (in.channels != scale_.size()) {
        throw std::invalid_argument("batch_norm expects " + std::to_string(scale_.size()) + " channels");
    }
    return in;
}

Tensor BatchNormLayer::forward(const Tensor& in) const {
    Tensor out = in;
    for (size_t t = 0; t < in.steps; ++t) {
        for (size_t c = 0; c < in.channels; ++c) {
            out.at(t, c) = in.at(t, c) * scale_[c] + shift_[c];
        }
    }
    return out;
}

// ---- LSTM ----

LSTMLayer::LSTMLayer(size_t in, size_t units, std::vector<double> kernel,
                     std::vector<double> recurrent, std::vector<double> bias,
                     bool return_sequences, bool go_backwards)
    : in_(in), units_(units)
    , kernel_(std::move(kernel)), recurrent_(std::move(recurrent)), bias_(std::move(bias))
    , return_sequences_(return_sequences), go_backwards_(go_backwards)
{
    if (in_ == 0 || units_ == 0 ||
        kernel_.size() != in_ * 4 * units_ ||
        recurrent_.size() != units_ * 4 * units_ ||
        bias_.size() != 4 * units_) {
        throw std::invalid_argument("lstm layer dimensions do not match");
    }
}

TensorShape LSTMLayer::output_shape(const TensorShape& in) const {
    if (in.channels != in_) {
        throw std::invalid_argument("lstm expects " + std::to_string(in_) +
                                    " channels, got " + std::to_string(in.channels));
    }
    if (in.steps == 0) {
        throw std::invalid_argument("lstm on empty sequence");
    }
    return {return_sequences_ ? in.steps : 1, units_};
}

Tensor LSTMLayer::forward(const Tensor& in) const {
    TensorShape shape = output_shape({in.steps, in.channels});
    Tensor out(shape.steps, units_);
    
    const size_t gates = 4 * units_;
    std::vector<double> h(units_, 0.0), c(units_, 0.0), z(gates);
    
    for (size_t k = 0; k < in.steps; ++k) {
        size_t t = go_backwards_ ? in.steps - 1 - k : k;
        
        std::copy(bias_.begin(), bias_.end(), z.begin());
        for (size_t i = 0; i < in_; ++i) {
            double xv = in.at(t, i);
            const double* w = &kernel_[i * gates];
            for (size_t g = 0; g < gates; ++g) z[g] += xv * w[g];
        }
        for (size_t u = 0; u < units_; ++u) {
            const double* w = &recurrent_[u * gates];
            for (size_t g = 0; g < gates; ++g) z[g] += h[u] * w[g];
        }
        
        for (size_t u = 0; u < units_; ++u) {
            double ig = util::sigmoid(z[u]);
            double fg = util::sigmoid(z[units_ + u]);
            double cand = std::tanh(z[2 * units_ + u]);
            double og = util::sigmoid(z[3 * units_ + u]);
            c[u] = fg * c[u] + ig * cand;
            h[u] = og * std::tanh(c[u]);
        }
        
        // Outputs are kept in processing order, as Keras does for go_backwards
        if (return_sequences_) {
            std::copy(h.begin(), h.end(), &out.data[k * units_]);
        }
    }
    
    if (!return_sequences_) {
        std::copy(h.begin(), h.end(), out.data.begin());
    }
    return out;
}

BidirectionalLayer::BidirectionalLayer(std::unique_ptr<LSTMLayer> forward,
                                       std::unique_ptr<LSTMLayer> backward)
    : forward_(std::move(forward)), backward_(std::move(backward))
{
    if (!forward_ || !backward_) {
        throw std::invalid_argument("bidirectional layer needs both directions");
    }
    if (forward_->returns_sequences() != backward_->returns_sequences()) {
        throw std::invalid_argument("bidirectional directions disagree on return_sequences");
    }
}

TensorShape BidirectionalLayer::output_shape(const TensorShape& in) const {
    TensorShape f = forward_->output_shape(in);
    TensorShape b = backward_->output_shape(in);
    return {f.steps, f.channels + b.channels};
}

Tensor BidirectionalLayer::forward(const Tensor& in) const {
    Tensor f = forward_->forward(in);
    Tensor b = backward_->forward(in);
    
    Tensor out(f.steps, f.channels + b.channels);
    for (size_t t = 0; t < f.steps; ++t) {
        size_t bt = forward_->returns_sequences() ? f.steps - 1 - t : t;
        for (size_t c = 0; c < f.channels; ++c) out.at(t, c) = f.at(t, c);
        for (size_t c = 0; c < b.channels; ++c) out.at(t, f.channels + c) = b.at(bt, c);
    }
    return out;
}

// ---- Network ----

NeuralNetwork::NeuralNetwork(InputLayout layout, TensorShape input_shape,
                             std::vector<std::unique_ptr<Layer>> layers)
    : layout_(layout), input_shape_(input_shape), layers_(std::move(layers))
{
    if (input_shape_.steps == 0 || input_shape_.channels == 0) {
        throw std::invalid_argument("network input shape must be non-empty");
    }
    if (layers_.empty()) {
        throw std::invalid_argument("network has no layers");
    }
    
    TensorShape shape = input_shape_;
    for (size_t i = 0; i < layers_.size(); ++i) {
        try {
            shape = layers_[i]->output_shape(shape);
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument("layer " + std::to_string(i) + " (" +
                                        layers_[i]->kind() + "): " + e.what());
        }
    }
    output_shape_ = shape;
}

std::unique_ptr<NeuralNetwork> NeuralNetwork::from_json(const nlohmann::json& artifact) {
    const auto& input = artifact.at("input");
    std::string layout_name = input.value("layout", "flat");
    
    InputLayout layout;
    TensorShape shape;
    if (layout_name == "flat") {
        layout = InputLayout::Flat;
        shape = {1, input.at("size").get<size_t>()};
    } else if (layout_name == "sequence") {
        layout = InputLayout::Sequence;
        const auto& dims = input.at("shape");
        if (!dims.is_array() || dims.size() != 2) {
            throw std::invalid_argument("sequence input shape must be [steps, channels]");
        }
        shape = {dims[0].get<size_t>(), dims[1].get<size_t>()};
    } else {
        throw std::invalid_argument("unknown input layout: " + layout_name);
    }
    
    std::vector<std::unique_ptr<Layer>> layers;
    for (const auto& def : artifact.at("layers")) {
        if (def.value("type", "") == "dropout") continue;
        layers.push_back(parse_layer(def));
    }
    
    return std::make_unique<NeuralNetwork>(layout, shape, std::move(layers));
}

Tensor NeuralNetwork::forward(const std::vector<double>& x) const {
    if (x.size() != input_size()) {
        throw std::invalid_argument("network expects " + std::to_string(input_size()) +
                                    " inputs, got " + std::to_string(x.size()));
    }
    
    Tensor current;
    current.data = x;
    current.steps = input_shape_.steps;
    current.channels = input_shape_.channels;
    
    for (const auto& layer : layers_) {
        current = layer->forward(current);
    }
    return current;
}
