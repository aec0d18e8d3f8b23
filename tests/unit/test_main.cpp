#include <iostream>

void test_vector_store();
void test_similarity();
void test_drift();
void test_scorers();
void test_fusion();
void test_phase();
void test_policy();
void test_failure_tracker();
void test_admission();
void test_precheck();
void test_config();
void test_wire();
void test_engine();

int main() {
  test_vector_store();
  test_similarity();
  test_drift();
  test_scorers();
  test_fusion();
  test_phase();
  test_policy();
  test_failure_tracker();
  test_admission();
  test_precheck();
  test_config();
  test_wire();
  test_engine();
  std::cout << "trustgate_tests ok\n";
  return 0;
}
