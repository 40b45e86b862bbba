#include "tree_scorer.hpp"
#include "util.hpp"
#include <stdexcept>

namespace {

// Fills internal node values from their children when the artifact omits them
double fill_expected_values(DecisionTree& tree, int idx, const std::vector<bool>& has_value) {
    TreeNode& node = tree.nodes[idx];
    if (node.is_leaf() || has_value[idx]) {
        return node.value;
    }
    double l = fill_expected_values(tree, node.left, has_value);
    double r = fill_expected_values(tree, node.right, has_value);
    node.value = 0.5 * (l + r);
    return node.value;
}

TreeAggregation aggregation_from_string(const std::string& s) {
    if (s == "mean") return TreeAggregation::Mean;
    if (s == "logit_sum") return TreeAggregation::LogitSum;
    throw std::invalid_argument("unknown tree aggregation: " + s);
}

} // namespace

TreeEnsembleScorer::TreeEnsembleScorer(std::vector<DecisionTree> trees, TreeAggregation aggregation,
                                       double base_score, size_t n_features)
    : trees_(std::move(trees))
    , aggregation_(aggregation)
    , base_score_(base_score)
    , n_features_(n_features)
{
    if (trees_.empty()) {
        throw std::invalid_argument("tree ensemble has no trees");
    }
    if (n_features_ == 0) {
        throw std::invalid_argument("tree ensemble needs n_features");
    }
    for (const auto& tree : trees_) {
        validate_tree(tree, n_features_);
    }
}

void TreeEnsembleScorer::validate_tree(const DecisionTree& tree, size_t n_features) {
    if (tree.nodes.empty()) {
        throw std::invalid_argument("tree has no nodes");
    }
    const int n = static_cast<int>(tree.nodes.size());
    std::vector<bool> seen(tree.nodes.size(), false);
    std::vector<int> stack = {0};
    
    while (!stack.empty()) {
        int idx = stack.back();
        stack.pop_back();
        if (seen[idx]) {
            throw std::invalid_argument("tree node " + std::to_string(idx) + " is reachable twice");
        }
        seen[idx] = true;
        
        const TreeNode& node = tree.nodes[idx];
        if (node.is_leaf()) continue;
        
        if (node.left < 0 || node.right < 0 || node.left >= n || node.right >= n) {
            throw std::invalid_argument("tree node " + std::to_string(idx) + " has invalid children");
        }
        if (node.feature < 0 || static_cast<size_t>(node.feature) >= n_features) {
            throw std::invalid_argument("tree node " + std::to_string(idx) + " splits on unknown feature");
        }
        stack.push_back(node.left);
        stack.push_back(node.right);
    }
}

std::shared_ptr<TreeEnsembleScorer> TreeEnsembleScorer::from_json(const nlohmann::json& artifact) {
    TreeAggregation aggregation = aggregation_from_string(artifact.value("aggregation", "mean"));
    size_t n_features = artifact.at("n_features").get<size_t>();
    
    std::vector<DecisionTree> trees;
    for (const auto& jt : artifact.at("trees")) {
        DecisionTree tree;
        const auto& jnodes = jt.at("nodes");
        tree.nodes.resize(jnodes.size());
        std::vector<bool> has_value(jnodes.size(), false);
        
        for (size_t i = 0; i < jnodes.size(); ++i) {
            const auto& jn = jnodes[i];
            TreeNode& node = tree.nodes[i];
            node.feature = jn.value("feature", -1);
            node.threshold = jn.value("threshold", 0.0);
            node.left = jn.value("left", -1);
            node.right = jn.value("right", -1);
            if (jn.contains("value")) {
                node.value = jn.at("value").get<double>();
                has_value[i] = true;
            } else if (node.is_leaf()) {
                throw std::invalid_argument("leaf node " + std::to_string(i) + " has no value");
            }
        }
        
        validate_tree(tree, n_features);
        fill_expected_values(tree, 0, has_value);
        trees.push_back(std::move(tree));
    }
    
    return std::make_shared<TreeEnsembleScorer>(
        std::move(trees), aggregation, artifact.value("base_score", 0.0), n_features);
}

void TreeEnsembleScorer::check_input(const std::vector<double>& x) const {
    if (x.size() != n_features_) {
        throw std::invalid_argument("tree ensemble expects " + std::to_string(n_features_) +
                                    " features, got " + std::to_string(x.size()));
    }
}

int TreeEnsembleScorer::next_node(const TreeNode& node, const std::vector<double>& x) {
    return x[node.feature] <= node.threshold ? node.left : node.right;
}

double TreeEnsembleScorer::raw_output(const std::vector<double>& x) const {
    check_input(x);
    
    double total = 0.0;
    for (const auto& tree : trees_) {
        int idx = 0;
        while (!tree.nodes[idx].is_leaf()) {
            idx = next_node(tree.nodes[idx], x);
        }
        total += tree.nodes[idx].value;
    }
    
    if (aggregation_ == TreeAggregation::Mean) {
        return total / static_cast<double>(trees_.size());
    }
    return base_score_ + total;
}

double TreeEnsembleScorer::expected_output() const {
    double total = 0.0;
    for (const auto& tree : trees_) {
        total += tree.nodes[0].value;
    }
    if (aggregation_ == TreeAggregation::Mean) {
        return total / static_cast<double>(trees_.size());
    }
    return base_score_ + total;
}

double TreeEnsembleScorer::score(const std::vector<double>& x) const {
    double raw = raw_output(x);
    if (aggregation_ == TreeAggregation::Mean) {
        return util::clamp01(raw);
    }
    return util::sigmoid(raw);
}

std::vector<double> TreeEnsembleScorer::native_attribution(const std::vector<double>& x) const {
    check_input(x);
    
    std::vector<double> contrib(n_features_, 0.0);
    for (const auto& tree : trees_) {
        int idx = 0;
        while (!tree.nodes[idx].is_leaf()) {
            const TreeNode& node = tree.nodes[idx];
            int child = next_node(node, x);
            contrib[node.feature] += tree.nodes[child].value - node.value;
            idx = child;
        }
    }
    
    if (aggregation_ == TreeAggregation::Mean) {
        double n = static_cast<double>(trees_.size());
        for (auto& c : contrib) c /= n;
    }
    return contrib;
}
