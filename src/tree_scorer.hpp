#pragma once

#include "scorer.hpp"
#include <nlohmann/json.hpp>

struct TreeNode {
    int feature = -1;
    double threshold = 0.0;
    int left = -1;
    int right = -1;
    double value = 0.0;   // leaf output; for internal nodes the expected output below it
    
    bool is_leaf() const { return left < 0 && right < 0; }
};

struct DecisionTree {
    std::vector<TreeNode> nodes;   // nodes[0] is the root
};

enum class TreeAggregation {
    Mean,      // bagged probabilities (random forest)
    LogitSum   // boosted margins: sigmoid(base_score + sum of leaves)
};

// Explicit-tree ensemble; x[feature] <= threshold goes left
class TreeEnsembleScorer : public Scorer {
public:
    TreeEnsembleScorer(std::vector<DecisionTree> trees, TreeAggregation aggregation,
                       double base_score, size_t n_features);
    
    static std::shared_ptr<TreeEnsembleScorer> from_json(const nlohmann::json& artifact);
    
    double score(const std::vector<double>& x) const override;
    size_t input_size() const override { return n_features_; }
    std::string algorithm() const override { return "tree_ensemble"; }
    
    bool has_native_attribution() const override { return true; }
    
    // Decision-path contributions in the ensemble's output space
    // (probability for Mean, margin for LogitSum). They sum to
    // raw_output(x) - expected_output().
    std::vector<double> native_attribution(const std::vector<double>& x) const override;
    
    double raw_output(const std::vector<double>& x) const;
    double expected_output() const;
    size_t tree_count() const { return trees_.size(); }
    
private:
    std::vector<DecisionTree> trees_;
    TreeAggregation aggregation_;
    double base_score_;
    size_t n_features_;
    
    void check_input(const std::vector<double>& x) const;
    static void validate_tree(const DecisionTree& tree, size_t n_features);
    static int next_node(const TreeNode& node, const std::vector<double>& x);
};
