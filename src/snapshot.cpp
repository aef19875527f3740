#include <blobsim/snapshot.hpp>
#include <blobsim/q_network.hpp>

#include <torch/torch.h>

#include <cvx/misc/format.hpp>

using namespace std ;
using namespace Eigen ;

namespace blobsim {

using RowMatrixXf = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> ;

const char *ParameterSnapshot::layerName(int i) {
    static const char *names[kNumLayers] = { "layer1", "layer2", "layer3" } ;
    return names[i] ;
}

static torch::nn::Linear layer(const QNetwork &net, int i) {
    switch ( i ) {
    case 0: return net.layer1_ ;
    case 1: return net.layer2_ ;
    default: return net.layer3_ ;
    }
}

static LayerParameters from_tensors(const at::Tensor &w, const at::Tensor &b) {
    at::Tensor wc = w.detach().to(at::kFloat).contiguous() ;
    at::Tensor bc = b.detach().to(at::kFloat).contiguous() ;

    LayerParameters lp ;
    lp.weight_ = Map<const RowMatrixXf>(wc.data_ptr<float>(), wc.size(0), wc.size(1)) ;
    lp.bias_ = Map<const VectorXf>(bc.data_ptr<float>(), bc.size(0)) ;
    return lp ;
}

static at::Tensor to_tensor(const MatrixXf &m) {
    RowMatrixXf r = m ;
    return torch::from_blob(r.data(), { r.rows(), r.cols() }, torch::TensorOptions().dtype(at::kFloat)).clone() ;
}

static at::Tensor to_tensor(const VectorXf &v) {
    return torch::from_blob((void *)v.data(), { v.size() }, torch::TensorOptions().dtype(at::kFloat)).clone() ;
}

ParameterSnapshot ParameterSnapshot::capture(const QNetwork &net) {
    ParameterSnapshot snap ;
    for( int i=0 ; i<kNumLayers ; i++ ) {
        auto l = layer(net, i) ;
        snap.layers_.emplace(layerName(i), from_tensors(l->weight, l->bias)) ;
    }
    return snap ;
}

void ParameterSnapshot::checkConsistency() const {
    for( int i=0 ; i<kNumLayers ; i++ ) {
        auto it = layers_.find(layerName(i)) ;
        if ( it == layers_.end() )
            throw SnapshotException(cvx::format("snapshot has no parameters for {}", layerName(i))) ;

        const LayerParameters &lp = it->second ;
        if ( lp.bias_.size() != lp.weight_.rows() )
            throw SnapshotException(cvx::format("bias of {} has {} entries, expected {}", layerName(i), lp.bias_.size(), lp.weight_.rows())) ;

        if ( i > 0 ) {
            const LayerParameters &prev = layers_.at(layerName(i-1)) ;
            if ( lp.weight_.cols() != prev.weight_.rows() )
                throw SnapshotException(cvx::format("{} takes {} inputs but {} has {} outputs",
                                                    layerName(i), lp.weight_.cols(), layerName(i-1), prev.weight_.rows())) ;
        }
    }
}

void ParameterSnapshot::applyTo(QNetwork &net) const {
    checkConsistency() ;

    for( int i=0 ; i<kNumLayers ; i++ ) {
        const LayerParameters &lp = layers_.at(layerName(i)) ;
        auto l = layer(net, i) ;
        if ( lp.weight_.rows() != l->weight.size(0) || lp.weight_.cols() != l->weight.size(1) )
            throw SnapshotException(cvx::format("{} is {}x{} in the snapshot but {}x{} in the network", layerName(i),
                                                lp.weight_.rows(), lp.weight_.cols(), l->weight.size(0), l->weight.size(1))) ;
    }

    torch::NoGradGuard no_grad ;

    for( int i=0 ; i<kNumLayers ; i++ ) {
        const LayerParameters &lp = layers_.at(layerName(i)) ;
        auto l = layer(net, i) ;
        l->weight.copy_(to_tensor(lp.weight_)) ;
        l->bias.copy_(to_tensor(lp.bias_)) ;
    }
}

void ParameterSnapshot::save(const std::string &path) const {
    checkConsistency() ;

    torch::serialize::OutputArchive archive;

    for( int i=0 ; i<kNumLayers ; i++ ) {
        const LayerParameters &lp = layers_.at(layerName(i)) ;
        archive.write(string(layerName(i)) + ".weight", to_tensor(lp.weight_)) ;
        archive.write(string(layerName(i)) + ".bias", to_tensor(lp.bias_)) ;
    }

    try {
        archive.save_to(path);
    } catch ( const std::exception &e ) {
        throw SnapshotException(cvx::format("cannot write snapshot {}: {}", path, e.what())) ;
    }
}

ParameterSnapshot ParameterSnapshot::load(const std::string &path) {
    torch::serialize::InputArchive archive ;

    try {
        archive.load_from(path) ;
    } catch ( const std::exception &e ) {
        throw SnapshotException(cvx::format("cannot read snapshot {}: {}", path, e.what())) ;
    }

    ParameterSnapshot snap ;

    for( int i=0 ; i<kNumLayers ; i++ ) {
        string name = layerName(i) ;
        at::Tensor w, b ;
        if ( !archive.try_read(name + ".weight", w) || !archive.try_read(name + ".bias", b) )
            throw SnapshotException(cvx::format("snapshot {} has no parameters for {}", path, name)) ;

        if ( w.dim() != 2 || b.dim() != 1 )
            throw SnapshotException(cvx::format("snapshot {} has malformed parameters for {}", path, name)) ;

        snap.layers_.emplace(name, from_tensors(w, b)) ;
    }

    snap.checkConsistency() ;

    return snap ;
}

std::map<std::string, MatrixXf> ParameterSnapshot::toExportLayout() const {
    checkConsistency() ;

    std::map<std::string, MatrixXf> exported ;
    for( int i=0 ; i<kNumLayers ; i++ ) {
        const LayerParameters &lp = layers_.at(layerName(i)) ;
        exported["w" + to_string(i+1)] = lp.weight_.transpose() ;
        exported["b" + to_string(i+1)] = lp.bias_ ;
    }
    return exported ;
}

ParameterSnapshot ParameterSnapshot::fromExportLayout(const std::map<std::string, MatrixXf> &exported) {
    ParameterSnapshot snap ;

    for( int i=0 ; i<kNumLayers ; i++ ) {
        string wkey = "w" + to_string(i+1), bkey = "b" + to_string(i+1) ;
        auto wit = exported.find(wkey), bit = exported.find(bkey) ;
        if ( wit == exported.end() || bit == exported.end() )
            throw SnapshotException(cvx::format("exported parameters lack {} or {}", wkey, bkey)) ;

        const MatrixXf &b = bit->second ;

        LayerParameters lp ;
        lp.weight_ = wit->second.transpose() ;
        // biases may come as a row or a column
        if ( b.cols() == 1 ) lp.bias_ = b.col(0) ;
        else if ( b.rows() == 1 ) lp.bias_ = b.row(0).transpose() ;
        else
            throw SnapshotException(cvx::format("{} is not a vector", bkey)) ;

        snap.layers_.emplace(layerName(i), std::move(lp)) ;
    }

    snap.checkConsistency() ;

    return snap ;
}

bool ParameterSnapshot::operator == (const ParameterSnapshot &other) const {
    if ( layers_.size() != other.layers_.size() ) return false ;

    for( const auto &lp: layers_ ) {
        auto it = other.layers_.find(lp.first) ;
        if ( it == other.layers_.end() ) return false ;

        const LayerParameters &a = lp.second, &b = it->second ;
        if ( a.weight_.rows() != b.weight_.rows() || a.weight_.cols() != b.weight_.cols() ||
             a.bias_.size() != b.bias_.size() ) return false ;
        if ( a.weight_ != b.weight_ || a.bias_ != b.bias_ ) return false ;
    }

    return true ;
}

}
