//============================================================================
// Test Program: KaplanMeierFitter
//============================================================================
//
// Purpose:
//   Standalone test program for fitting Kaplan-Meier estimates end to end.
//
// What it tests:
//   - Closed form without censoring
//   - Right-censored example with median
//   - Shape of estimate, band and variance on simulated data
//   - Constant weights and the non-integral weight warning
//   - Step-function queries (predict, survival / cumulative density)
//   - Left truncation degeneracy and failed refits
//   - Left censorship (cumulative density)
//   - Confidence band labels
//   - Plotting hook and stream format
//   - Queries before a supplied timeline
//   - Stored configuration and band series
//
// Usage:
//   Run with: ./test_kaplanMeierFitter
//   Exit code is non-zero if any check fails.
//
//============================================================================

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "DataTypes.hh"
#include "EstimatePlotter.hh"
#include "InputValidation.hh"
#include "KaplanMeierFitter.hh"
#include "TruncationDiagnostics.hh"

using namespace std;
using namespace SurvivalEstimation;

static int g_checks = 0;
static int g_failures = 0;

static void check(bool condition, const string& name) {
    ++g_checks;
    if (!condition) ++g_failures;
    cout << "  " << setw(6) << (condition ? "PASS" : "FAIL") << "  " << name << endl;
}

static bool nearAll(const vector<double>& a, const vector<double>& b, double tol = 1e-12) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (fabs(a[i] - b[i]) > tol) return false;
    }
    return true;
}

/**
 * @brief Records what the fitter hands to a renderer
 */
class RecordingPlotter : public EstimatePlotter {
public:
    RecordingPlotter() : estimates(0) {}

    virtual void plot(const KaplanMeierEstimate& estimate) {
        ++estimates;
        lastLabel = estimate.label;
    }

    virtual void plotSeries(const NamedSeries& s) {
        series.push_back(s);
    }

    int estimates;
    string lastLabel;
    vector<NamedSeries> series;
};

int main()
{
    const double inf = numeric_limits<double>::infinity();

    cout << "============================================" << endl;
    cout << "  KaplanMeierFitter Test Program            " << endl;
    cout << "============================================" << endl;

    //------------------------------------------------------------------------
    // Test 1: No censoring reduces to the empirical survival function
    //------------------------------------------------------------------------
    cout << "\n  TEST 1: Empirical survival without censoring" << endl;

    vector<double> uncensored = {1, 2, 2, 3, 4, 5, 5, 5, 6};
    KaplanMeierFitter kmf;
    check(!kmf.isFitted(), "fresh fitter is unfitted");

    bool unfittedThrows = false;
    try {
        kmf.getEstimate();
    } catch (const logic_error&) {
        unfittedThrows = true;
    }
    check(unfittedThrows, "reading an unfitted estimate throws");

    const KaplanMeierEstimate& empirical = kmf.fit(LifetimeData(uncensored));
    bool matches = true;
    for (size_t i = 0; i < empirical.timeline.size(); ++i) {
        const double t = empirical.timeline[i];
        const double surviving = static_cast<double>(
            count_if(uncensored.begin(), uncensored.end(), [t](double d) { return d > t; }));
        if (fabs(empirical.estimate[i] - surviving / uncensored.size()) > 1e-12) matches = false;
    }
    check(matches, "S(t) = fraction with duration > t");
    check(empirical.estimate.back() < 1e-12, "S reaches zero after the last death");
    check(kmf.median() == 4.0, "median of the uncensored sample");

    //------------------------------------------------------------------------
    // Test 2: Right-censored example
    //------------------------------------------------------------------------
    cout << "\n  TEST 2: Right-censored example" << endl;

    vector<double> durations = {5, 6, 6, 2, 4};
    vector<double> events = {1, 0, 1, 1, 1};
    const KaplanMeierEstimate& example = kmf.fit(LifetimeData(durations, events));
    example.print();

    check(example.kind == EstimateKind::SurvivalFunction, "right censoring fits S(t)");
    check(nearAll(example.timeline, {0, 2, 4, 5, 6}), "timeline from the event table");
    check(nearAll(example.estimate, {1.0, 0.8, 0.6, 0.4, 0.2}), "product-limit estimate");
    check(example.median == 5.0, "median survival time");
    check(example.upper[0] == 1.0 && example.lower[0] == 1.0, "band equals estimate at S = 1");
    check(example.eventObserved == vector<int>({1, 0, 1, 1, 1}), "event flags kept on the estimate");
    check(example.estimateSeries().name == "KM_estimate", "estimate series named by label");
    check(example.varianceSeries().name == "KM_estimate_cumulative_variance", "variance series name");

    //------------------------------------------------------------------------
    // Test 3: Shape on simulated data
    //------------------------------------------------------------------------
    cout << "\n  TEST 3: Shape on simulated data" << endl;

    mt19937 rng(20240607);
    exponential_distribution<double> lifetime(0.1);
    bernoulli_distribution observed(0.7);

    LifetimeData simulated;
    for (int i = 0; i < 200; ++i) {
        simulated.durations.push_back(std::ceil(lifetime(rng)));
        simulated.eventObserved.push_back(observed(rng) ? 1.0 : 0.0);
    }
    const KaplanMeierEstimate& sim = kmf.fit(simulated);

    bool monotone = true;
    bool inUnit = true;
    bool bracketed = true;
    bool varianceOk = true;
    for (size_t i = 0; i < sim.timeline.size(); ++i) {
        if (i > 0 && sim.estimate[i] > sim.estimate[i - 1] + 1e-15) monotone = false;
        if (sim.estimate[i] < 0.0 || sim.estimate[i] > 1.0) inUnit = false;
        if (sim.lower[i] < 0.0 || sim.upper[i] > 1.0) inUnit = false;
        if (sim.lower[i] > sim.estimate[i] + 1e-12 || sim.upper[i] < sim.estimate[i] - 1e-12) bracketed = false;
        if (sim.cumulativeVariance[i] < 0.0) varianceOk = false;
        if (i > 0 && sim.cumulativeVariance[i] < sim.cumulativeVariance[i - 1]) varianceOk = false;
    }
    check(monotone, "estimate is non-increasing");
    check(inUnit, "estimate and bounds lie in [0, 1]");
    check(bracketed, "lower <= estimate <= upper");
    check(varianceOk, "variance is non-negative and non-decreasing");

    //------------------------------------------------------------------------
    // Test 4: Weights
    //------------------------------------------------------------------------
    cout << "\n  TEST 4: Weights" << endl;

    KaplanMeierFitter weightedFitter;
    LifetimeData tripled(durations, events);
    tripled.weights.assign(durations.size(), 3.0);
    const KaplanMeierEstimate& weighted = weightedFitter.fit(tripled);
    check(nearAll(weighted.estimate, {1.0, 0.8, 0.6, 0.4, 0.2}), "constant weights cancel");
    check(weighted.warnings.empty(), "integral weights raise no warning");
    check(weighted.eventTable[0].atRisk == 15.0, "weights scale the event table");

    LifetimeData halved(durations, events);
    halved.weights.assign(durations.size(), 0.5);

    ostringstream captured;
    streambuf* saved = cerr.rdbuf(captured.rdbuf());
    const KaplanMeierEstimate& fractional = weightedFitter.fit(halved);
    cerr.rdbuf(saved);

    check(fractional.warnings.size() == 1, "non-integral weights recorded as a warning");
    check(captured.str().find("Warning:") != string::npos, "warning written to the error stream");
    check(nearAll(fractional.estimate, {1.0, 0.8, 0.6, 0.4, 0.2}), "fractional constant weights cancel");

    //------------------------------------------------------------------------
    // Test 5: Step-function queries
    //------------------------------------------------------------------------
    cout << "\n  TEST 5: Step-function queries" << endl;

    kmf.fit(LifetimeData(durations, events));
    check(nearAll(kmf.predict(kmf.getEstimate().timeline), kmf.getEstimate().estimate),
          "predict on the timeline returns the estimate");
    check(nearAll(kmf.predict(vector<double>{-3, 3, 5.5, 50}), {1.0, 0.8, 0.4, 0.2}),
          "predict between and beyond timeline points");

    NamedSeries atTimes = kmf.survivalFunctionAtTimes(vector<double>{2, 4}, "S");
    check(atTimes.name == "S" && nearAll(atTimes.values, {0.8, 0.6}), "survival function at times");
    NamedSeries density = kmf.cumulativeDensityAtTimes(vector<double>{2, 4});
    check(density.name == "KM_estimate" && nearAll(density.values, {0.2, 0.4}),
          "cumulative density at times");

    bool nanQuery = false;
    try {
        kmf.predict(vector<double>{numeric_limits<double>::quiet_NaN()});
    } catch (const ValidationError&) {
        nanQuery = true;
    }
    check(nanQuery, "NaN query time rejected");

    //------------------------------------------------------------------------
    // Test 6: Left truncation
    //------------------------------------------------------------------------
    cout << "\n  TEST 6: Left truncation" << endl;

    LifetimeData late(vector<double>{1, 2, 5, 6, 7, 8});
    late.entry = {0, 0, 0, 3, 3, 3};
    const KaplanMeierEstimate& truncated = kmf.fit(late);
    check(truncated.eventTable.size() == 8, "entry times added to the table");
    check(fabs(truncated.estimate[1] - 2.0 / 3.0) < 1e-12, "first death among three at risk");

    const vector<double> beforeFailure = kmf.getEstimate().estimate;

    LifetimeData emptied(vector<double>{1, 2, 5, 6, 7, 8});
    emptied.entry = {0, 0, 3, 3, 3, 3};
    bool degenerate = false;
    try {
        kmf.fit(emptied);
    } catch (const StatisticalDegeneracyError& e) {
        cout << "    (" << e.what() << ")" << endl;
        degenerate = (e.time() == 2.0);
    }
    check(degenerate, "emptied risk set raises degeneracy error");
    check(kmf.isFitted() && kmf.getEstimate().estimate == beforeFailure,
          "failed refit keeps the previous estimate");

    bool badInput = false;
    try {
        kmf.fit(LifetimeData(vector<double>{1, inf}));
    } catch (const ValidationError&) {
        badInput = true;
    }
    check(badInput, "infinite duration rejected");
    check(kmf.getEstimate().estimate == beforeFailure, "invalid input keeps the previous estimate");

    //------------------------------------------------------------------------
    // Test 7: Left censorship
    //------------------------------------------------------------------------
    cout << "\n  TEST 7: Left censorship" << endl;

    FitConfig leftConfig;
    leftConfig.leftCensorship = true;
    KaplanMeierFitter leftFitter(leftConfig);
    const KaplanMeierEstimate& left = leftFitter.fit(LifetimeData(vector<double>{1, 2, 3}));
    left.print();

    check(left.kind == EstimateKind::CumulativeDensity, "left censorship fits F(t)");
    check(nearAll(left.estimate, {0.0, 1.0 / 3.0, 2.0 / 3.0, 1.0}), "cumulative density");
    check(left.median == 2.0, "median is first time with F >= 0.5");
    check(left.upper.back() == 1.0 && left.lower.back() == 1.0, "band equals estimate at F = 1");
    check(left.upper.front() == 0.0 && left.lower.front() == 0.0, "band collapses at F = 0");
    check(nearAll(leftFitter.predict(vector<double>{-1}), {0.0}), "F is zero before the timeline");
    check(nearAll(leftFitter.survivalFunctionAtTimes(vector<double>{2}).values, {1.0 / 3.0}),
          "survival from a cumulative density fit");

    //------------------------------------------------------------------------
    // Test 8: Configuration and labels
    //------------------------------------------------------------------------
    cout << "\n  TEST 8: Configuration and labels" << endl;

    check(kmf.fit(LifetimeData(durations, events)).upperLabel == "KM_estimate_upper_0.95",
          "default upper label");
    check(kmf.getEstimate().lowerLabel == "KM_estimate_lower_0.95", "default lower label");

    FitConfig narrow;
    narrow.alpha = 0.1;
    narrow.label = "group_A";
    const KaplanMeierEstimate& relabelled = kmf.fit(LifetimeData(durations, events), narrow);
    check(relabelled.upperLabel == "group_A_upper_0.9", "per-call configuration used");
    check(kmf.getConfig().label == "KM_estimate", "stored configuration untouched");

    FitConfig badLabels;
    badLabels.ciLabels = {"a", "b", "c"};
    bool rejected = false;
    try {
        kmf.fit(LifetimeData(durations, events), badLabels);
    } catch (const ValidationError&) {
        rejected = true;
    }
    check(rejected, "three ci labels rejected");

    //------------------------------------------------------------------------
    // Test 9: Plotting hook
    //------------------------------------------------------------------------
    cout << "\n  TEST 9: Plotting hook" << endl;

    kmf.fit(LifetimeData(durations, events));
    RecordingPlotter recorder;
    kmf.plot(recorder);
    kmf.plotLogLogs(recorder);
    check(recorder.estimates == 1 && recorder.lastLabel == "KM_estimate", "estimate handed to renderer");
    check(recorder.series.size() == 1 && recorder.series[0].name == "log(-log(KM_estimate))",
          "log-log series handed to renderer");
    check(recorder.series[0].size() == 4, "log-log keeps points with 0 < S < 1 and t > 0");
    check(fabs(recorder.series[0].index[0] - log(2.0)) < 1e-12 &&
          fabs(recorder.series[0].values[0] - log(-log(0.8))) < 1e-12,
          "log-log coordinates");

    ostringstream table;
    TablePlotter text(table);
    kmf.plot(text);
    check(table.str().find("KM_estimate_upper_0.95") != string::npos, "text table carries band names");

    ostringstream formatted;
    formatted << setprecision(3);
    const ios_base::fmtflags flagsBefore = formatted.flags();
    TablePlotter precise(formatted, 6);
    kmf.plot(precise);
    kmf.plotLogLogs(precise);
    kmf.getEstimate().print(formatted);
    check(formatted.flags() == flagsBefore && formatted.precision() == 3,
          "caller's stream format restored after rendering");

    //------------------------------------------------------------------------
    // Test 10: Supplied timeline starting after the first event
    //------------------------------------------------------------------------
    cout << "\n  TEST 10: Supplied timeline starting after the first event" << endl;

    LifetimeData coarse(durations, events);
    coarse.timeline = {3, 10};
    const KaplanMeierEstimate& reported = kmf.fit(coarse);
    check(nearAll(reported.timeline, {3, 10}) && nearAll(reported.estimate, {0.8, 0.2}),
          "estimate reported on the supplied timeline");
    check(nearAll(kmf.predict(vector<double>{-1, 0, 2.5, 3, 4.5}), {1.0, 1.0, 0.8, 0.8, 0.8}),
          "times before the supplied timeline use the event table");

    LifetimeData coarseLeft(vector<double>{1, 2, 3});
    coarseLeft.timeline = {2.5, 10};
    leftFitter.fit(coarseLeft);
    check(nearAll(leftFitter.getEstimate().estimate, {2.0 / 3.0, 1.0}), "coarse cumulative density");
    check(nearAll(leftFitter.predict(vector<double>{-1, 1.5}), {0.0, 1.0 / 3.0}),
          "cumulative density before the supplied timeline uses the event table");

    //------------------------------------------------------------------------
    // Test 11: Stored configuration and band series
    //------------------------------------------------------------------------
    cout << "\n  TEST 11: Stored configuration and band series" << endl;

    KaplanMeierFitter configured;
    FitConfig armB;
    armB.alpha = 0.1;
    armB.label = "arm_B";
    configured.setConfig(armB);
    const KaplanMeierEstimate& armFit = configured.fit(LifetimeData(durations, events));
    check(configured.getConfig().label == "arm_B" && armFit.label == "arm_B",
          "fit uses the configuration set on the fitter");

    NamedSeries upperBand = armFit.upperSeries();
    NamedSeries lowerBand = armFit.lowerSeries();
    check(upperBand.name == "arm_B_upper_0.9" && lowerBand.name == "arm_B_lower_0.9",
          "band series named by the labels");
    check(upperBand.index == armFit.timeline && upperBand.values == armFit.upper &&
          lowerBand.values == armFit.lower,
          "band series indexed by the timeline");

    //------------------------------------------------------------------------
    // Test 12: Failed fits stay silent
    //------------------------------------------------------------------------
    cout << "\n  TEST 12: Failed fits stay silent" << endl;

    LifetimeData weightedEmptied(vector<double>{1, 2, 5, 6, 7, 8});
    weightedEmptied.entry = {0, 0, 3, 3, 3, 3};
    weightedEmptied.weights.assign(6, 0.5);

    ostringstream silent;
    streambuf* savedErr = cerr.rdbuf(silent.rdbuf());
    bool failed = false;
    try {
        configured.fit(weightedEmptied);
    } catch (const StatisticalDegeneracyError&) {
        failed = true;
    }
    cerr.rdbuf(savedErr);
    check(failed, "degenerate weighted fit rejected");
    check(silent.str().empty(), "no weight caveat printed for a rejected fit");

    //------------------------------------------------------------------------
    // Summary
    //------------------------------------------------------------------------
    cout << "\n============================================" << endl;
    cout << "  TEST SUMMARY" << endl;
    cout << "============================================" << endl;
    cout << "  " << setw(20) << "Checks" << setw(10) << g_checks << endl;
    cout << "  " << setw(20) << "Failures" << setw(10) << g_failures << endl;
    cout << "  " << setw(20) << "Status" << setw(10) << (g_failures == 0 ? "PASS" : "FAIL") << endl;

    return g_failures == 0 ? 0 : 1;
}
