#include <gtest/gtest.h>
#include "centroid_classifier.hpp"
#include "data_generator.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "metrics.hpp"

#include <algorithm>
#include <memory>
#include <numeric>
#include <random>
#include <string>
#include <vector>

using namespace centrix;

namespace {

const Metric kAllMetrics[] = {Metric::Euclidean, Metric::Manhattan, Metric::Cosine};

ClassSet pizza_classes() {
    return ClassSet{"pizza_slice", "whole_pizza", "pizza_box"};
}

// One training sample per class, sitting exactly on the unit axes.
CentroidClassifier make_axis_classifier() {
    CentroidClassifier clf(pizza_classes(), 3);
    clf.fit({{"pizza_slice", {1.0f, 0.0f, 0.0f}},
             {"whole_pizza", {0.0f, 1.0f, 0.0f}},
             {"pizza_box", {0.0f, 0.0f, 1.0f}}});
    return clf;
}

}  // namespace

// 1. Centroid is the exact coordinate-wise mean.
TEST(CentroidClassifier, FitComputesClassMeans) {
    CentroidClassifier clf(ClassSet{"a", "b"}, 2);
    auto c = clf.fit({{"a", {1.0f, 2.0f}},
                      {"b", {10.0f, 10.0f}},
                      {"a", {3.0f, 6.0f}},
                      {"a", {5.0f, 1.0f}}});

    ASSERT_TRUE(clf.fitted());
    EXPECT_EQ(c->k(), 2u);
    EXPECT_EQ(c->dim(), 2u);
    EXPECT_EQ(c->count(0), 3u);
    EXPECT_EQ(c->count(1), 1u);
    EXPECT_FLOAT_EQ(c->row(0)[0], 3.0f);
    EXPECT_FLOAT_EQ(c->row(0)[1], 3.0f);
    EXPECT_EQ(c->centroid("b"), (std::vector<float>{10.0f, 10.0f}));
}

// 2. Mean is invariant to the order of the training samples.
TEST(CentroidClassifier, FitIsOrderInvariant) {
    const ImageShape shape{8, 8, 3};
    const size_t n = 900;
    const size_t dim = shape.dim();
    auto imgs = generate_class_images(n, shape, 3, 5);

    std::vector<size_t> perm(n);
    std::iota(perm.begin(), perm.end(), size_t(0));
    std::mt19937 rng(99);
    std::shuffle(perm.begin(), perm.end(), rng);

    std::vector<float> shuffled(n * dim);
    std::vector<int> shuffled_labels(n);
    for (size_t i = 0; i < n; ++i) {
        std::copy(imgs.data.begin() + perm[i] * dim,
                  imgs.data.begin() + (perm[i] + 1) * dim,
                  shuffled.begin() + i * dim);
        shuffled_labels[i] = imgs.labels[perm[i]];
    }

    CentroidClassifier a(pizza_classes(), dim), b(pizza_classes(), dim);
    auto ca = a.fit(imgs.data.data(), n, dim, imgs.labels.data());
    auto cb = b.fit(shuffled.data(), n, dim, shuffled_labels.data());

    for (size_t i = 0; i < 3 * dim; ++i)
        EXPECT_NEAR(ca->data()[i], cb->data()[i], 1e-4f) << "index " << i;
}

// 3. [0.9, 0.1, 0.05] is nearest to the first axis under every metric.
TEST(CentroidClassifier, SelfClassification) {
    auto clf = make_axis_classifier();
    std::vector<float> x = {0.9f, 0.1f, 0.05f};

    for (Metric m : kAllMetrics) {
        Prediction p = clf.predict(x, m);
        EXPECT_EQ(p.label, 0) << metric_name(m);
        EXPECT_EQ(p.class_name, "pizza_slice") << metric_name(m);
        ASSERT_EQ(p.distances.size(), 3u);
        EXPECT_LT(p.distances[0], p.distances[1]);
        EXPECT_LT(p.distances[0], p.distances[2]);
        EXPECT_FLOAT_EQ(p.distance(), p.distances[0]);
    }
}

// 4. Equidistant classes resolve to the lowest declared index.
TEST(CentroidClassifier, TieBreaksToFirstDeclaredClass) {
    auto clf = make_axis_classifier();

    std::vector<float> all_equal = {1.0f, 1.0f, 1.0f};
    std::vector<float> last_two = {0.0f, 1.0f, 1.0f};
    for (Metric m : kAllMetrics) {
        EXPECT_EQ(clf.predict(all_equal, m).label, 0) << metric_name(m);
        EXPECT_EQ(clf.predict(last_two, m).label, 1) << metric_name(m);
    }

    // A difference inside the tolerance still counts as a tie.
    const float d[] = {1.0f, 1.0f - 5e-7f, 0.5f};
    EXPECT_EQ(select_nearest(d, 2, kDefaultTieTolerance), 0);
    EXPECT_EQ(select_nearest(d, 3, kDefaultTieTolerance), 2);
}

TEST(CentroidClassifier, EmptyClassNamesTheClass) {
    CentroidClassifier clf(ClassSet{"A", "B", "C"}, 2);
    try {
        clf.fit({{"A", {1.0f, 0.0f}}, {"B", {0.0f, 1.0f}}});
        FAIL() << "expected EmptyClassError";
    } catch (const EmptyClassError& e) {
        EXPECT_EQ(e.class_name(), "C");
        EXPECT_NE(std::string(e.what()).find("'C'"), std::string::npos);
    }
    EXPECT_FALSE(clf.fitted());
}

TEST(CentroidClassifier, PredictBeforeFitThrows) {
    CentroidClassifier clf(pizza_classes(), 3);
    std::vector<float> x = {1.0f, 2.0f, 3.0f};
    EXPECT_FALSE(clf.fitted());
    EXPECT_THROW(clf.predict(x, Metric::Euclidean), NotFittedError);
    EXPECT_THROW(clf.predict_batch(x.data(), 1, 3, Metric::Cosine), NotFittedError);
    std::vector<int> labels;
    EXPECT_THROW(clf.assign(x.data(), 1, 3, Metric::Manhattan, labels), NotFittedError);
}

TEST(CentroidClassifier, InvalidTrainingInputThrows) {
    CentroidClassifier clf(pizza_classes(), 3);
    EXPECT_THROW(clf.fit({{"pizza_slice", {1.0f, 2.0f}}}), DimensionMismatchError);
    EXPECT_THROW(clf.fit({{"calzone", {1.0f, 2.0f, 3.0f}}}), UnknownClassError);

    std::vector<float> data(6, 1.0f);
    const int bad_labels[] = {0, 7};
    EXPECT_THROW(clf.fit(data.data(), 2, 3, bad_labels), UnknownClassError);
    EXPECT_THROW(clf.fit(data.data(), 3, 2, bad_labels), DimensionMismatchError);
    EXPECT_FALSE(clf.fitted());
}

TEST(CentroidClassifier, PredictValidatesInput) {
    auto clf = make_axis_classifier();
    std::vector<float> wrong = {1.0f, 2.0f};
    EXPECT_THROW(clf.predict(wrong, Metric::Euclidean), DimensionMismatchError);

    std::vector<float> zero = {0.0f, 0.0f, 0.0f};
    EXPECT_THROW(clf.predict(zero, Metric::Cosine), ZeroVectorError);
    EXPECT_EQ(clf.predict(zero, Metric::Euclidean).label, 0);
}

// A failed refit keeps the previous centroids; a good refit replaces them
// while old snapshots stay intact.
TEST(CentroidClassifier, RefitIsAllOrNothing) {
    auto clf = make_axis_classifier();
    auto before = clf.centroids();

    EXPECT_THROW(clf.fit({{"pizza_slice", {5.0f, 5.0f, 5.0f}}}), EmptyClassError);
    EXPECT_EQ(clf.centroids(), before);
    EXPECT_EQ(clf.predict(std::vector<float>{0.9f, 0.1f, 0.0f}, Metric::Euclidean).label, 0);

    clf.fit({{"pizza_slice", {0.0f, 0.0f, 1.0f}},
             {"whole_pizza", {0.0f, 1.0f, 0.0f}},
             {"pizza_box", {1.0f, 0.0f, 0.0f}}});
    EXPECT_NE(clf.centroids(), before);
    EXPECT_EQ(clf.predict(std::vector<float>{0.9f, 0.1f, 0.0f}, Metric::Euclidean).label, 2);
    EXPECT_FLOAT_EQ(before->row(0)[0], 1.0f);
}

// Batch prediction matches one-at-a-time prediction.
TEST(CentroidClassifier, BatchMatchesSinglePredictions) {
    const ImageShape shape{16, 16, 3};
    const size_t dim = shape.dim();
    auto train = generate_class_images(600, shape, 3, 21, 40.0f, 0.2f);
    auto test = generate_class_images(120, shape, 3, 22, 40.0f, 0.2f);

    CentroidClassifier clf(pizza_classes(), dim);
    clf.fit(train.data.data(), 600, dim, train.labels.data());

    for (Metric m : kAllMetrics) {
        auto batch = clf.predict_batch(test.data.data(), 120, dim, m);
        std::vector<int> labels;
        clf.assign(test.data.data(), 120, dim, m, labels);
        ASSERT_EQ(batch.size(), 120u);
        for (size_t i = 0; i < 120; ++i) {
            Prediction single = clf.predict(test.data.data() + i * dim, dim, m);
            EXPECT_EQ(batch[i].label, single.label) << metric_name(m) << " row " << i;
            EXPECT_EQ(batch[i].class_name, single.class_name);
            EXPECT_EQ(labels[i], single.label);
            for (size_t c = 0; c < 3; ++c)
                EXPECT_FLOAT_EQ(batch[i].distances[c], single.distances[c]);
        }
    }
}

TEST(CentroidClassifier, BatchReportsZeroRowForCosine) {
    auto clf = make_axis_classifier();
    std::vector<float> rows = {1.0f, 0.0f, 0.0f,
                               0.0f, 0.0f, 0.0f};
    EXPECT_THROW(clf.predict_batch(rows.data(), 2, 3, Metric::Cosine), ZeroVectorError);
    EXPECT_THROW(clf.predict_batch(rows.data(), 2, 2, Metric::Euclidean),
                 DimensionMismatchError);
    EXPECT_NO_THROW(clf.predict_batch(rows.data(), 2, 3, Metric::Manhattan));
}

// A class trained only on blank images has a zero centroid; cosine
// prediction names that class on both the single and the batch path.
TEST(CentroidClassifier, ZeroCentroidNamedForCosine) {
    CentroidClassifier clf(ClassSet{"blank", "lit"}, 2);
    clf.fit({{"blank", {0.0f, 0.0f}},
             {"blank", {0.0f, 0.0f}},
             {"lit", {3.0f, 4.0f}}});

    const std::vector<float> x = {1.0f, 1.0f};
    try {
        clf.predict(x, Metric::Cosine);
        FAIL() << "expected ZeroVectorError";
    } catch (const ZeroVectorError& e) {
        EXPECT_NE(std::string(e.what()).find("'blank'"), std::string::npos) << e.what();
    }
    try {
        clf.predict_batch(x.data(), 1, 2, Metric::Cosine);
        FAIL() << "expected ZeroVectorError";
    } catch (const ZeroVectorError& e) {
        EXPECT_NE(std::string(e.what()).find("'blank'"), std::string::npos) << e.what();
    }

    EXPECT_EQ(clf.predict(x, Metric::Euclidean).class_name, "blank");
}

// Separable synthetic classes are recovered with high accuracy, and global
// brightness changes do not affect the cosine metric.
TEST(CentroidClassifier, SeparableClassesAccuracy) {
    const ImageShape shape{32, 32, 3};
    const size_t dim = shape.dim();
    const size_t n_train = 300, n_test = 90;
    auto all = generate_class_images(n_train + n_test, shape, 3, 8, 50.0f, 0.25f);

    CentroidClassifier clf(pizza_classes(), dim);
    clf.fit(all.data.data(), n_train, dim, all.labels.data());

    const float* test = all.data.data() + n_train * dim;
    const int* truth = all.labels.data() + n_train;
    for (Metric m : kAllMetrics) {
        std::vector<int> pred;
        clf.assign(test, n_test, dim, m, pred);
        EXPECT_GT(compute_accuracy(pred.data(), truth, n_test), 0.95f) << metric_name(m);
    }
}

TEST(ClassSet, ValidatesNames) {
    EXPECT_THROW(ClassSet(std::vector<std::string>{}), std::invalid_argument);
    EXPECT_THROW((ClassSet{"a", "a"}), std::invalid_argument);
    EXPECT_THROW((ClassSet{"a", ""}), std::invalid_argument);

    ClassSet cs = pizza_classes();
    EXPECT_EQ(cs.size(), 3u);
    EXPECT_EQ(cs.index_of("pizza_box"), 2);
    EXPECT_TRUE(cs.contains("whole_pizza"));
    EXPECT_FALSE(cs.contains("calzone"));
    EXPECT_THROW(cs.index_of("calzone"), UnknownClassError);
}

TEST(CentroidClassifier, VerboseFitLogsPerClassCounts) {
    ClassifierConfig cfg;
    cfg.verbose = true;
    CentroidClassifier clf(ClassSet{"a", "b"}, 2, cfg);

    LogLevel saved = log_level();
    set_log_level(LogLevel::Info);
    testing::internal::CaptureStderr();
    clf.fit({{"a", {1.0f, 2.0f}}, {"b", {3.0f, 4.0f}}, {"b", {5.0f, 6.0f}}});
    std::string out = testing::internal::GetCapturedStderr();
    set_log_level(saved);

    EXPECT_NE(out.find("[centrix][INFO]"), std::string::npos);
    EXPECT_NE(out.find("class 'b': 2 samples"), std::string::npos);

    set_log_level(LogLevel::Off);
    testing::internal::CaptureStderr();
    clf.fit({{"a", {1.0f, 2.0f}}, {"b", {3.0f, 4.0f}}});
    EXPECT_TRUE(testing::internal::GetCapturedStderr().empty());
    set_log_level(saved);
}
