#include "DummySandbox.hpp"
#include "JobScheduler.hpp"
#include "WorkflowParser.hpp"
#include <cassert>
#include <iostream>
#include <memory>
#include <thread>

namespace {

struct Harness {
    ConfigData config;
    DummySandbox sandbox;
    MapSecretProvider secrets;
    std::unique_ptr<JobScheduler> scheduler;

    explicit Harness(const std::string& yaml, int concurrency = 4, bool fail_fast = false) {
        config.workflow = WorkflowParser::parse(yaml);
        config.concurrency = concurrency;
        config.global.fail_fast = fail_fast;
    }

    Status run() {
        scheduler = std::make_unique<JobScheduler>(config, sandbox, secrets);
        return scheduler->run();
    }

    JobRecord job(const std::string& id) const { return scheduler->context().job(id); }
    Status status(const std::string& id) const { return job(id).status; }
};

} // namespace

// Job1 fails without continue-on-error -> Job2 is skipped, the run fails
void test_failed_dependency_skips_dependent() {
    Harness h(R"(
jobs:
  job1:
    steps:
      - run: exit 1
  job2:
    needs: [job1]
    steps:
      - run: echo job2
)");
    Status status = h.run();

    assert(status == Status::Failure);
    assert(h.status("job1") == Status::Failure);
    assert(h.status("job2") == Status::Skipped);
    assert(h.job("job2").steps[0].status == Status::Skipped);
    assert(h.sandbox.execution_count() == 1);
    assert(h.scheduler->has_failure());
    std::cout << "test_failed_dependency_skips_dependent passed.\n";
}

// Matrix of two values and two steps -> two instances, four executions
void test_matrix_instances_are_independent() {
    Harness h(R"(
jobs:
  test:
    strategy:
      fail-fast: false
      matrix:
        os: [a, b]
    steps:
      - run: echo on ${{ matrix.os }}
      - run: exit ${{ matrix.os == 'b' && 1 || 0 }}
)");
    Status status = h.run();

    assert(status == Status::Failure);
    assert(h.scheduler->plan().size() == 2);
    assert(h.sandbox.execution_count() == 4);
    assert(h.status("test (a)") == Status::Success);
    assert(h.status("test (b)") == Status::Failure);
    assert(h.job("test (a)").steps[0].log[0] == "on a");
    std::cout << "test_matrix_instances_are_independent passed.\n";
}

// Step output referenced by a later step of the same instance
void test_step_output_reference() {
    Harness h(R"(
jobs:
  calc:
    steps:
      - id: prev
        run: echo ::set-output::result=42
      - id: use
        run: echo value=${{ steps.prev.outputs.result }}
)");
    assert(h.run() == Status::Success);

    auto use = h.scheduler->context().step("calc", "use");
    assert(use->log.size() == 1);
    assert(use->log[0] == "value=42");
    std::cout << "test_step_output_reference passed.\n";
}

// Job budget shorter than the step -> timeout, instance fails, one termination
void test_job_timeout() {
    Harness h(R"(
jobs:
  slow:
    timeout-minutes: 0.001
    steps:
      - run: sleep 5000
      - run: echo never
)");
    Status status = h.run();

    assert(status == Status::Failure);
    JobRecord rec = h.job("slow");
    assert(rec.status == Status::Failure);
    assert(rec.error == ErrorKind::Timeout);
    assert(rec.steps[0].status == Status::Failure);
    assert(rec.steps[0].error == ErrorKind::Timeout);
    assert(rec.steps[1].status == Status::Skipped);
    assert(h.sandbox.termination_count() == 1);
    std::cout << "test_job_timeout passed.\n";
}

// A newer instance in the group cancels the running older one before it starts
void test_concurrency_group_supersedes() {
    Harness h(R"(
jobs:
  old:
    concurrency: deploy-prod
    steps:
      - run: sleep 5000
  warmup:
    steps:
      - run: sleep 100
  new:
    needs: warmup
    concurrency:
      group: deploy-${{ env.STAGE }}
    env:
      STAGE: prod
    steps:
      - run: echo deployed
)");
    Status status = h.run();

    JobRecord old_rec = h.job("old");
    JobRecord new_rec = h.job("new");
    assert(old_rec.status == Status::Cancelled);
    assert(old_rec.steps[0].status == Status::Cancelled);
    assert(new_rec.status == Status::Success);
    assert(*old_rec.finished_at <= *new_rec.started_at);
    assert(h.sandbox.termination_count() == 1);
    // Supersession is not an external abort
    assert(status == Status::Success);
    std::cout << "test_concurrency_group_supersedes passed.\n";
}

// The older holder fills the only slot, the newer instance still cancels it
void test_concurrency_group_supersedes_with_full_pool() {
    Harness h(R"(
jobs:
  old:
    concurrency: release
    steps:
      - run: sleep 5000
  new:
    concurrency: release
    steps:
      - run: echo released
)", 1);
    Status status = h.run();

    JobRecord old_rec = h.job("old");
    JobRecord new_rec = h.job("new");
    assert(old_rec.status == Status::Cancelled);
    assert(new_rec.status == Status::Success);
    assert(*old_rec.finished_at <= *new_rec.started_at);
    assert(h.sandbox.termination_count() == 1);
    assert(h.sandbox.max_running() == 1);
    assert(status == Status::Success);
    std::cout << "test_concurrency_group_supersedes_with_full_pool passed.\n";
}

void test_concurrency_group_waits_without_cancel() {
    Harness h(R"(
jobs:
  first:
    concurrency:
      group: shared
      cancel-in-progress: false
    steps:
      - run: sleep 100
  second:
    concurrency:
      group: shared
      cancel-in-progress: false
    steps:
      - run: sleep 100
)");
    assert(h.run() == Status::Success);
    assert(h.sandbox.max_running() == 1);
    JobRecord first = h.job("first");
    JobRecord second = h.job("second");
    assert(*first.finished_at <= *second.started_at);
    std::cout << "test_concurrency_group_waits_without_cancel passed.\n";
}

void test_matrix_fail_fast() {
    Harness h(R"(
jobs:
  check:
    strategy:
      matrix:
        include:
          - name: quick
            delay: 100
            code: 1
          - name: slow
            delay: 5000
            code: 0
    steps:
      - run: |
          sleep ${{ matrix.delay }}
          exit ${{ matrix.code }}
  after:
    needs: check
    steps:
      - run: echo after
)");
    Status status = h.run();

    auto instances = h.scheduler->plan().instances_of("check");
    assert(instances.size() == 2);
    assert(h.status(instances[0]->id) == Status::Failure);
    assert(h.status(instances[1]->id) == Status::Cancelled);
    assert(h.status("after") == Status::Skipped);
    assert(h.sandbox.termination_count() == 1);
    assert(status == Status::Failure);
    std::cout << "test_matrix_fail_fast passed.\n";
}

void test_run_level_fail_fast() {
    Harness h(R"(
jobs:
  broken:
    steps:
      - run: |
          sleep 100
          exit 1
  long:
    steps:
      - run: sleep 5000
  later:
    needs: long
    steps:
      - run: echo later
)", 4, true);
    Status status = h.run();

    assert(status == Status::Failure);
    assert(h.status("broken") == Status::Failure);
    assert(h.status("long") == Status::Cancelled);
    assert(h.status("later") == Status::Cancelled);
    assert(!h.scheduler->context().cancelled_externally());
    std::cout << "test_run_level_fail_fast passed.\n";
}

void test_job_outputs_through_needs() {
    Harness h(R"(
jobs:
  build:
    outputs:
      version: ${{ steps.meta.outputs.version }}-${{ steps.meta.outputs.build }}
    steps:
      - id: meta
        run: |
          echo ::set-output::version=2.0
          echo ::set-output::build=17
  deploy:
    needs: build
    if: needs.build.result == 'success'
    steps:
      - run: echo deploying ${{ needs.build.outputs.version }}
)");
    assert(h.run() == Status::Success);
    assert(h.job("build").outputs.at("version") == "2.0-17");
    assert(h.job("deploy").steps[0].log[0] == "deploying 2.0-17");
    std::cout << "test_job_outputs_through_needs passed.\n";
}

void test_status_functions_on_jobs() {
    Harness h(R"(
jobs:
  build:
    steps:
      - run: exit 1
  test:
    needs: build
    steps:
      - run: echo test
  report:
    needs: test
    if: always()
    steps:
      - run: echo report
  rollback:
    needs: test
    if: failure()
    steps:
      - run: echo rollback
  celebrate:
    needs: test
    if: success()
    steps:
      - run: echo celebrate
)");
    assert(h.run() == Status::Failure);
    assert(h.status("test") == Status::Skipped);
    assert(h.status("report") == Status::Success);
    assert(h.status("rollback") == Status::Success);
    assert(h.status("celebrate") == Status::Skipped);
    std::cout << "test_status_functions_on_jobs passed.\n";
}

void test_job_continue_on_error() {
    Harness h(R"(
jobs:
  optional:
    continue-on-error: true
    steps:
      - run: exit 1
  next:
    needs: optional
    steps:
      - run: echo next ${{ needs.optional.result }}
)");
    assert(h.run() == Status::Success);
    assert(h.status("optional") == Status::Failure);
    assert(h.status("next") == Status::Success);
    assert(h.job("next").steps[0].log[0] == "next failure");
    std::cout << "test_job_continue_on_error passed.\n";
}

// A need skipped by its own condition does not skip the dependent
void test_skipped_dependency_keeps_dependent() {
    Harness h(R"(
jobs:
  docs:
    if: false
    steps:
      - run: echo docs
  next:
    needs: docs
    steps:
      - run: echo next ${{ needs.docs.result }}
  notify:
    needs: docs
    if: failure()
    steps:
      - run: echo notify
)");
    assert(h.run() == Status::Success);
    assert(h.status("docs") == Status::Skipped);
    assert(h.status("next") == Status::Success);
    assert(h.job("next").steps[0].log[0] == "next skipped");
    assert(h.status("notify") == Status::Skipped);
    assert(h.sandbox.execution_count() == 1);
    std::cout << "test_skipped_dependency_keeps_dependent passed.\n";
}

// A tolerated job failure is still visible to failure() downstream
void test_failure_function_sees_tolerated_failure() {
    Harness h(R"(
jobs:
  optional:
    continue-on-error: true
    steps:
      - run: exit 1
  onfail:
    needs: optional
    if: failure()
    steps:
      - run: echo cleanup
  onsuccess:
    needs: optional
    if: success()
    steps:
      - run: echo proceed
)");
    assert(h.run() == Status::Success);
    assert(h.status("optional") == Status::Failure);
    assert(h.status("onfail") == Status::Success);
    assert(h.job("onfail").steps[0].log[0] == "cleanup");
    assert(h.status("onsuccess") == Status::Success);
    std::cout << "test_failure_function_sees_tolerated_failure passed.\n";
}

void test_retries_in_a_job() {
    Harness h(R"(
jobs:
  flaky:
    steps:
      - retries: 2
        run: exit 1
)");
    assert(h.run() == Status::Failure);
    assert(h.sandbox.execution_count() == 3);
    assert(h.job("flaky").steps[0].attempts == 3);
    std::cout << "test_retries_in_a_job passed.\n";
}

void test_max_parallel() {
    Harness h(R"(
jobs:
  shard:
    strategy:
      max-parallel: 1
      matrix:
        n: [1, 2, 3, 4]
    steps:
      - run: sleep 30
)", 4);
    assert(h.run() == Status::Success);
    assert(h.sandbox.execution_count() == 4);
    assert(h.sandbox.max_running() == 1);
    std::cout << "test_max_parallel passed.\n";
}

void test_concurrency_limit() {
    Harness h(R"(
jobs:
  a:
    steps: [{run: sleep 50}]
  b:
    steps: [{run: sleep 50}]
  c:
    steps: [{run: sleep 50}]
  d:
    steps: [{run: sleep 50}]
)", 2);
    assert(h.run() == Status::Success);
    assert(h.sandbox.max_running() <= 2);
    assert(h.sandbox.execution_count() == 4);
    std::cout << "test_concurrency_limit passed.\n";
}

void test_external_cancel() {
    Harness h(R"(
jobs:
  long:
    steps:
      - run: sleep 5000
  after:
    needs: long
    if: always()
    steps:
      - run: echo after
)");
    h.scheduler = std::make_unique<JobScheduler>(h.config, h.sandbox, h.secrets);
    std::thread canceller([&h] {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        h.scheduler->cancel();
    });
    Status status = h.scheduler->run();
    canceller.join();

    assert(status == Status::Cancelled);
    assert(h.status("long") == Status::Cancelled);
    assert(h.status("after") == Status::Cancelled);
    assert(h.sandbox.termination_count() == 1);
    assert(h.sandbox.execution_count() == 1);
    std::cout << "test_external_cancel passed.\n";
}

void test_cycle_executes_nothing() {
    Harness h(R"(
jobs:
  a:
    needs: b
    steps: [{run: echo a}]
  b:
    needs: a
    steps: [{run: echo b}]
)");
    bool threw = false;
    try {
        h.run();
    } catch (const GraphError&) {
        threw = true;
    }
    assert(threw);
    (void)threw;
    assert(h.sandbox.execution_count() == 0);
    std::cout << "test_cycle_executes_nothing passed.\n";
}

void test_secrets_resolved_and_masked() {
    Harness h(R"(
jobs:
  publish:
    steps:
      - run: echo pushing with ${{ secrets.REGISTRY_TOKEN }}
)");
    h.secrets.set("REGISTRY_TOKEN", "tok-123");
    assert(h.run() == Status::Success);

    assert(h.sandbox.requests()[0].command == "echo pushing with tok-123");
    assert(h.job("publish").steps[0].log[0] == "pushing with ***");
    assert(h.scheduler->masker().mask("tok-123") == "***");
    std::cout << "test_secrets_resolved_and_masked passed.\n";
}

void test_acyclic_plan_runs_in_dependency_order() {
    Harness h(R"(
jobs:
  lint:
    steps: [{run: echo lint}]
  build:
    needs: lint
    steps: [{run: echo build}]
  unit:
    needs: build
    steps: [{run: echo unit}]
  e2e:
    needs: build
    steps: [{run: echo e2e}]
  release:
    needs: [unit, e2e]
    steps: [{run: echo release}]
)");
    assert(h.run() == Status::Success);

    const auto& plan = h.scheduler->plan();
    for (const JobInstance* instance : plan.instances()) {
        JobRecord rec = h.job(instance->id);
        assert(rec.status == Status::Success);
        for (const auto& dep : plan.dependencies(instance->id)) {
            assert(*h.job(dep).finished_at <= *rec.started_at);
        }
    }
    std::cout << "test_acyclic_plan_runs_in_dependency_order passed.\n";
}

int main() {
    test_failed_dependency_skips_dependent();
    test_matrix_instances_are_independent();
    test_step_output_reference();
    test_job_timeout();
    test_concurrency_group_supersedes();
    test_concurrency_group_supersedes_with_full_pool();
    test_concurrency_group_waits_without_cancel();
    test_matrix_fail_fast();
    test_run_level_fail_fast();
    test_job_outputs_through_needs();
    test_status_functions_on_jobs();
    test_job_continue_on_error();
    test_skipped_dependency_keeps_dependent();
    test_failure_function_sees_tolerated_failure();
    test_retries_in_a_job();
    test_max_parallel();
    test_concurrency_limit();
    test_external_cancel();
    test_cycle_executes_nothing();
    test_secrets_resolved_and_masked();
    test_acyclic_plan_runs_in_dependency_order();
    std::cout << "All JobScheduler tests passed.\n";
    return 0;
}
