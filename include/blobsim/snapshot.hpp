#pragma once

#include <map>
#include <string>

#include <Eigen/Core>

#include <blobsim/exceptions.hpp>

namespace blobsim {

struct QNetwork ;

struct LayerParameters {
    Eigen::MatrixXf weight_ ; // out x in, as stored by the network
    Eigen::VectorXf bias_ ;
};

// Flat copy of the parameters of a QNetwork keyed by layer name (layer1, layer2, layer3).
//
// Two layouts are supported: the in-memory one, where the weights of a layer
// map inputs to outputs as W * x, and the export layout used by numpy, ONNX and
// JSON consumers, where weights are transposed (x * W) and keyed w1, b1, ... w3, b3.

class ParameterSnapshot {
public:
    ParameterSnapshot() = default ;

    static ParameterSnapshot capture(const QNetwork &net) ;

    // Copy into the network. Throws SnapshotException and leaves the network
    // untouched if a layer is missing or its shape differs.
    void applyTo(QNetwork &net) const ;

    void save(const std::string &path) const ;

    // throws SnapshotException if the file is missing, unreadable or incomplete
    static ParameterSnapshot load(const std::string &path) ;

    std::map<std::string, Eigen::MatrixXf> toExportLayout() const ;
    static ParameterSnapshot fromExportLayout(const std::map<std::string, Eigen::MatrixXf> &exported) ;

    const std::map<std::string, LayerParameters> &layers() const { return layers_ ; }
    std::map<std::string, LayerParameters> &layers() { return layers_ ; }

    bool operator == (const ParameterSnapshot &other) const ;

    static const char *layerName(int i) ;
    static constexpr int kNumLayers = 3 ;

private:

    // checks that consecutive layers chain and biases match weights
    void checkConsistency() const ;

    std::map<std::string, LayerParameters> layers_ ;
};

}
